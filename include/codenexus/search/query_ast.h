#pragma once

#include <memory>
#include <string>

namespace codenexus::search {

/**
 * @brief Types of query nodes in the AST
 */
enum class QueryNodeType {
    Term,     // Exact tag
    And,      // AND operator
    Or,       // OR operator
    Not,      // NOT operator
    Wildcard, // Tag pattern containing '*'
    Group     // Parenthesised expression
};

/**
 * @brief Base class for query AST nodes
 */
class QueryNode {
public:
    virtual ~QueryNode() = default;
    virtual QueryNodeType getType() const = 0;
    virtual std::string toString() const = 0;
};

/**
 * @brief Term node - a full "type:value" tag matched exactly
 */
class TermNode : public QueryNode {
public:
    explicit TermNode(const std::string& term) : term_(term) {}

    QueryNodeType getType() const override { return QueryNodeType::Term; }
    std::string toString() const override { return term_; }

    const std::string& getTerm() const { return term_; }

private:
    std::string term_;
};

/**
 * @brief Binary operator node base class
 */
class BinaryOpNode : public QueryNode {
public:
    BinaryOpNode(std::unique_ptr<QueryNode> left, std::unique_ptr<QueryNode> right)
        : left_(std::move(left)), right_(std::move(right)) {}

    const QueryNode* getLeft() const { return left_.get(); }
    const QueryNode* getRight() const { return right_.get(); }

protected:
    std::unique_ptr<QueryNode> left_;
    std::unique_ptr<QueryNode> right_;
};

class AndNode : public BinaryOpNode {
public:
    using BinaryOpNode::BinaryOpNode;

    QueryNodeType getType() const override { return QueryNodeType::And; }
    std::string toString() const override {
        return "(" + left_->toString() + " AND " + right_->toString() + ")";
    }
};

class OrNode : public BinaryOpNode {
public:
    using BinaryOpNode::BinaryOpNode;

    QueryNodeType getType() const override { return QueryNodeType::Or; }
    std::string toString() const override {
        return "(" + left_->toString() + " OR " + right_->toString() + ")";
    }
};

/**
 * @brief NOT operator node - complement against every tagged file
 */
class NotNode : public QueryNode {
public:
    explicit NotNode(std::unique_ptr<QueryNode> child) : child_(std::move(child)) {}

    QueryNodeType getType() const override { return QueryNodeType::Not; }
    std::string toString() const override { return "NOT " + child_->toString(); }

    const QueryNode* getChild() const { return child_.get(); }

private:
    std::unique_ptr<QueryNode> child_;
};

/**
 * @brief Wildcard node - '*' matches zero or more characters, nothing else is special
 */
class WildcardNode : public QueryNode {
public:
    explicit WildcardNode(const std::string& pattern) : pattern_(pattern) {}

    QueryNodeType getType() const override { return QueryNodeType::Wildcard; }
    std::string toString() const override { return pattern_; }

    const std::string& getPattern() const { return pattern_; }

private:
    std::string pattern_;
};

class GroupNode : public QueryNode {
public:
    explicit GroupNode(std::unique_ptr<QueryNode> child) : child_(std::move(child)) {}

    QueryNodeType getType() const override { return QueryNodeType::Group; }
    std::string toString() const override { return "(" + child_->toString() + ")"; }

    const QueryNode* getChild() const { return child_.get(); }

private:
    std::unique_ptr<QueryNode> child_;
};

} // namespace codenexus::search
