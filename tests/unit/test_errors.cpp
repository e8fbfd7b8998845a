#include <gtest/gtest.h>
#include "core/errors/contract_errors.hpp"

using namespace evo::core::errors;

// A dummy decoder that either yields a value or reports a located error
Result<std::string> simulate_read_document(bool should_fail) {
    if (should_fail) {
        return config_error("unknown field `server.hots`", "unknown_key", "server.hots",
                            SourceLocation{3, 1});
    }
    return std::string("document contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_read_document(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "document contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_read_document(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Config);
    EXPECT_EQ(error.code, "unknown_key");
    EXPECT_EQ(error.path, "server.hots");
    ASSERT_TRUE(error.location.has_value());
    EXPECT_EQ(*error.location, (SourceLocation{3, 1}));
}

TEST(ErrorModelTest, DescribeIncludesPathAndLocation) {
    const auto error = config_error("bad value", "invalid_type", "server.port",
                                    SourceLocation{4, 8});

    EXPECT_EQ(error.describe(), "bad value (field `server.port`) at line 4, column 8");
}

TEST(ErrorModelTest, SchemaErrorsCarryNoLocation) {
    const auto error = schema_error("missing field `agent_id`", "missing_field", "agent_id");

    EXPECT_EQ(error.category, ErrorCategory::Schema);
    EXPECT_FALSE(error.location.has_value());
    EXPECT_EQ(error.describe(), "missing field `agent_id` (field `agent_id`)");
}

TEST(ErrorModelTest, ViolationCarriesTheError) {
    try {
        throw ContractViolation(schema_error("boom", "invalid_type"));
    } catch (const ContractViolation& violation) {
        EXPECT_EQ(violation.error().code, "invalid_type");
        EXPECT_STREQ(violation.what(), "boom");
    }
}

TEST(ErrorModelTest, TakeValueMovesThePayload) {
    Result<std::string> result = std::string("payload");

    const std::string value = take_value(std::move(result));

    EXPECT_EQ(value, "payload");
}
