#include "hqa/error.hpp"

#include <gtest/gtest.h>
#include <sstream>

namespace hqa
{
    TEST(ErrorTest, CodeAndMessage) {
        const Error error(ErrorCode::ResourceLimit, "too many units");

        EXPECT_EQ(error.code(), ErrorCode::ResourceLimit);
        EXPECT_EQ(error.message(), "too many units");
        EXPECT_FALSE(error.has_context());
    }

    TEST(ErrorTest, SecurityErrorCarriesReason) {
        const auto error = Error::security_error("Path rejected", "path-traversal");

        EXPECT_EQ(error.code(), ErrorCode::SecurityError);
        ASSERT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "path-traversal");
    }

    TEST(ErrorTest, Interruptions) {
        EXPECT_TRUE(Error::timeout("budget spent").is_interruption());
        EXPECT_TRUE(Error::cancelled("stop requested").is_interruption());
        EXPECT_FALSE(Error::analysis_error("scanner failed", "a.js").is_interruption());
        EXPECT_FALSE(Error::internal_error("bug").is_interruption());
    }

    TEST(ErrorTest, WithContextAppends) {
        const auto error = Error::config_error("bad value", "limits");

        const auto extended = error.with_context("max_units");

        EXPECT_EQ(extended.context().value(), "limits; max_units");
        EXPECT_EQ(Error::timeout("late").with_context("a.js").context().value(), "a.js");
    }

    TEST(ErrorTest, ToString) {
        EXPECT_EQ(Error::not_found("Catalog file not found", "fr.json").to_string(),
                  "[NotFound] Catalog file not found (context: fr.json)");
        EXPECT_EQ(Error::cancelled("stop requested").to_string(), "[Cancelled] stop requested");
    }

    TEST(ErrorTest, CodeNames) {
        EXPECT_STREQ(error_code_to_string(ErrorCode::None), "None");
        EXPECT_STREQ(error_code_to_string(ErrorCode::SecurityError), "SecurityError");
        EXPECT_STREQ(error_code_to_string(ErrorCode::Timeout), "Timeout");
        EXPECT_STREQ(error_code_to_string(ErrorCode::AnalysisError), "AnalysisError");
    }

    TEST(ErrorTest, Equality) {
        const auto a = Error::parse_error("bad json", "catalog");
        const auto b = Error::parse_error("bad json", "catalog");
        const auto c = Error::parse_error("bad json", "other");

        EXPECT_EQ(a, b);
        EXPECT_NE(a, c);
    }

    TEST(ErrorTest, StreamOutput) {
        std::ostringstream oss;
        oss << Error::io_error("write failed", "report.json") << " " << ErrorCode::IoError;

        EXPECT_EQ(oss.str(), "[IoError] write failed (context: report.json) IoError");
    }
}
