#pragma once

#include <codenexus/core/types.h>
#include <codenexus/search/query_ast.h>
#include <codenexus/search/query_parser.h>

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace codenexus::search {

using FileSet = std::set<std::string>;

/**
 * Read-only view of a tag index. The evaluator never copies or mutates the maps;
 * the owner must hold its lock for the lifetime of the view.
 */
struct TagIndexView {
    // full tag -> files carrying it
    const std::unordered_map<std::string, FileSet>& tagToFiles;
    // file -> tags; its keys are the universe for NOT
    const std::unordered_map<std::string, std::set<std::string>>& fileTags;
};

/**
 * Evaluates boolean/wildcard tag expressions against a TagIndexView.
 *
 * Exact tags are looked up directly, unknown tags yield an empty set. A term with '*'
 * matches every known tag whose text fits the pattern. An empty or blank expression
 * yields an empty result.
 */
class TagQueryEngine {
public:
    explicit TagQueryEngine(TagIndexView view) : view_(view) {}

    // Matching files in ascending order
    Result<std::vector<std::string>> execute(const std::string& expression) const;

    // Files matched by an already parsed expression
    FileSet evaluate(const QueryNode* node) const;

    /**
     * Cheap pre-check used before a query is accepted from a caller. Rejects blank
     * expressions, empty AND operands, and a lone tag without exactly one ':'. Then
     * runs the parser so unbalanced parentheses and dangling operators are caught too.
     */
    static Result<void> validateQuerySyntax(const std::string& expression);

    // Anchored glob match where only '*' is special
    static bool matchesWildcard(const std::string& pattern, const std::string& text);

private:
    FileSet lookupTag(const std::string& tag) const;
    FileSet lookupWildcard(const std::string& pattern) const;
    FileSet universe() const;

    TagIndexView view_;
};

} // namespace codenexus::search
