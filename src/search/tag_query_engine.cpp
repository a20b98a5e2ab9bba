#include <codenexus/search/tag_query_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace codenexus::search {

namespace {

std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> splitOn(const std::string& s, const std::string& delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delimiter, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + delimiter.size();
    }
    parts.push_back(s.substr(start));
    return parts;
}

} // namespace

Result<std::vector<std::string>> TagQueryEngine::execute(const std::string& expression) const {
    if (trimmed(expression).empty()) {
        return std::vector<std::string>{};
    }

    QueryParser parser;
    auto ast = parser.parse(expression);
    if (!ast) {
        spdlog::debug("Rejected tag query '{}': {}", expression, ast.error().message);
        return ast.error();
    }

    const FileSet files = evaluate(ast.value().get());
    spdlog::debug("Tag query '{}' matched {} file(s)", expression, files.size());
    return std::vector<std::string>(files.begin(), files.end());
}

FileSet TagQueryEngine::evaluate(const QueryNode* node) const {
    if (!node)
        return {};

    switch (node->getType()) {
        case QueryNodeType::Term:
            return lookupTag(static_cast<const TermNode*>(node)->getTerm());

        case QueryNodeType::Wildcard:
            return lookupWildcard(static_cast<const WildcardNode*>(node)->getPattern());

        case QueryNodeType::Group:
            return evaluate(static_cast<const GroupNode*>(node)->getChild());

        case QueryNodeType::And: {
            auto andNode = static_cast<const AndNode*>(node);
            FileSet left = evaluate(andNode->getLeft());
            if (left.empty())
                return left;
            FileSet right = evaluate(andNode->getRight());
            FileSet out;
            std::set_intersection(left.begin(), left.end(), right.begin(), right.end(),
                                  std::inserter(out, out.end()));
            return out;
        }

        case QueryNodeType::Or: {
            auto orNode = static_cast<const OrNode*>(node);
            FileSet out = evaluate(orNode->getLeft());
            FileSet right = evaluate(orNode->getRight());
            out.insert(right.begin(), right.end());
            return out;
        }

        case QueryNodeType::Not: {
            FileSet excluded = evaluate(static_cast<const NotNode*>(node)->getChild());
            FileSet all = universe();
            FileSet out;
            std::set_difference(all.begin(), all.end(), excluded.begin(), excluded.end(),
                                std::inserter(out, out.end()));
            return out;
        }
    }
    return {};
}

Result<void> TagQueryEngine::validateQuerySyntax(const std::string& expression) {
    const std::string query = trimmed(expression);
    if (query.empty()) {
        return Error{ErrorCode::InvalidQuerySyntax, "Query must not be empty"};
    }

    if (query.find(" AND ") != std::string::npos) {
        for (const auto& part : splitOn(query, " AND ")) {
            if (trimmed(part).empty()) {
                return Error{ErrorCode::InvalidQuerySyntax,
                             "AND operator needs an expression on both sides"};
            }
        }
    }

    if (query.find(':') != std::string::npos && query.find(' ') == std::string::npos) {
        if (splitOn(query, ":").size() != 2) {
            return Error{ErrorCode::InvalidQuerySyntax,
                         "Tag must have the form type:value: " + query};
        }
    }

    QueryParser parser;
    auto ast = parser.parse(query);
    if (!ast) {
        return ast.error();
    }
    return {};
}

bool TagQueryEngine::matchesWildcard(const std::string& pattern, const std::string& text) {
    const auto segments = splitOn(pattern, "*");
    if (segments.size() == 1) {
        return pattern == text;
    }

    const std::string& head = segments.front();
    const std::string& tail = segments.back();
    if (text.size() < head.size() + tail.size())
        return false;
    if (text.compare(0, head.size(), head) != 0)
        return false;
    if (text.compare(text.size() - tail.size(), tail.size(), tail) != 0)
        return false;

    // Interior segments in order, leftmost match, between the anchored ends
    size_t pos = head.size();
    const size_t limit = text.size() - tail.size();
    for (size_t i = 1; i + 1 < segments.size(); ++i) {
        const std::string& segment = segments[i];
        if (segment.empty())
            continue;
        const auto found = text.find(segment, pos);
        if (found == std::string::npos || found + segment.size() > limit)
            return false;
        pos = found + segment.size();
    }
    return true;
}

FileSet TagQueryEngine::lookupTag(const std::string& tag) const {
    auto it = view_.tagToFiles.find(tag);
    if (it == view_.tagToFiles.end())
        return {};
    return it->second;
}

FileSet TagQueryEngine::lookupWildcard(const std::string& pattern) const {
    FileSet out;
    for (const auto& [tag, files] : view_.tagToFiles) {
        if (matchesWildcard(pattern, tag)) {
            out.insert(files.begin(), files.end());
        }
    }
    return out;
}

FileSet TagQueryEngine::universe() const {
    FileSet all;
    for (const auto& [file, tags] : view_.fileTags) {
        if (!tags.empty())
            all.insert(file);
    }
    return all;
}

} // namespace codenexus::search
