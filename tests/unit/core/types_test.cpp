#include <gtest/gtest.h>

#include <codenexus/core/format.h>
#include <codenexus/core/json_types.h>
#include <codenexus/core/types.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace codenexus;

TEST(ResultTest, HoldsValue) {
    Result<std::vector<std::string>> result(std::vector<std::string>{"a", "b"});
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().size(), 2u);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, HoldsError) {
    Result<int> result(Error{ErrorCode::TagNotFound, "Tag 'a:b' not found"});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::TagNotFound);
    EXPECT_EQ(result.error().message, "Tag 'a:b' not found");
    EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(ResultTest, VoidDefaultsToSuccess) {
    Result<void> ok;
    EXPECT_TRUE(ok);

    Result<void> failed(ErrorCode::StorageError);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "Storage error");
}

TEST(ErrorTest, WithContextPrefixesMessage) {
    const Error base{ErrorCode::StorageError, "disk full"};
    const Error wrapped = withContext(base, "Failed to save tags");
    EXPECT_EQ(wrapped.code, ErrorCode::StorageError);
    EXPECT_EQ(wrapped.message, "Failed to save tags: disk full");
}

TEST(ErrorTest, CodeNamesAreStable) {
    EXPECT_STREQ(errorCodeName(ErrorCode::FileNotFound), "FILE_NOT_FOUND");
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidTagFormat), "INVALID_TAG_FORMAT");
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidQuerySyntax), "INVALID_QUERY_SYNTAX");
    EXPECT_STREQ(errorCodeName(ErrorCode::RelationAlreadyExists), "RELATION_ALREADY_EXISTS");
    EXPECT_STREQ(errorCodeName(ErrorCode::RelationNotFound), "RELATION_NOT_FOUND");
    EXPECT_STREQ(errorCodeName(ErrorCode::TagNotFound), "TAG_NOT_FOUND");
}

TEST(ErrorTest, EveryFailureHasSuggestion) {
    for (auto code : {ErrorCode::FileNotFound, ErrorCode::InvalidTagFormat,
                      ErrorCode::InvalidQuerySyntax, ErrorCode::RelationAlreadyExists,
                      ErrorCode::RelationNotFound, ErrorCode::TagNotFound,
                      ErrorCode::StorageError, ErrorCode::SerializationError,
                      ErrorCode::FileSystemError, ErrorCode::ConfigError,
                      ErrorCode::InternalError}) {
        EXPECT_STRNE(recoverySuggestion(code), "") << errorCodeName(code);
    }
}

TEST(FormatTest, FormatsErrorCodeByName) {
    EXPECT_EQ(codenexus::format("{}", ErrorCode::RelationNotFound), "RELATION_NOT_FOUND");
}

TEST(JsonTypesTest, RelationsUseSharedFieldNames) {
    nlohmann::json outgoing = std::vector<Relation>{{"src/lib.rs", "uses"}};
    EXPECT_EQ(outgoing, nlohmann::json::parse(R"([{"target":"src/lib.rs","description":"uses"}])"));

    nlohmann::json incoming = IncomingRelation{"src/main.rs", "calls"};
    EXPECT_EQ(incoming, nlohmann::json::parse(R"({"source":"src/main.rs","description":"calls"})"));

    EXPECT_EQ(outgoing.get<std::vector<Relation>>()[0], (Relation{"src/lib.rs", "uses"}));
    EXPECT_THROW(nlohmann::json::parse(R"({"target":"a"})").get<Relation>(),
                 nlohmann::json::exception);
}
