// @src/test/error_context.test.cpp
#include "gtest/gtest.h"
#include "../../include/storage_error/error_context.h"
#include "../../include/storage_error/error_handler.h"
#include "../../include/storage_error/error_utils.h"

#include <nlohmann/json.hpp>
#include <memory>
#include <vector>

using namespace storage;

namespace {
    class CountingHandler : public ErrorHandler {
    public:
        std::vector<ErrorCode> handled;
        std::vector<ErrorCode> critical;
        void handleError(const StorageError& error) override { handled.push_back(error.code); }
        void handleCriticalError(const StorageError& error) override { critical.push_back(error.code); }
    };

    class WarningHandler : public CountingHandler {
    public:
        std::vector<ErrorCode> warnings;
        void handleWarning(const StorageError& error) override { warnings.push_back(error.code); }
    };

    Result<int> parsePositive(int v) {
        if (v <= 0) return STORAGE_ERROR(ErrorCode::OPTION_OUT_OF_RANGE, "must be positive");
        return v;
    }

    Status doubled(int v, int& out) {
        int parsed = 0;
        ASSIGN_OR_RETURN(parsed, parsePositive(v));
        out = parsed * 2;
        return Status();
    }
}

TEST(StorageErrorTest, MetadataFollowsCode) {
    StorageError warning(ErrorCode::NON_ATOMIC_COMMIT);
    EXPECT_EQ(warning.severity, ErrorSeverity::WARNING);
    EXPECT_EQ(warning.category, ErrorCategory::TRANSACTION);
    EXPECT_EQ(warning.message, "NON_ATOMIC_COMMIT");
    EXPECT_TRUE(warning.isRecoverable());

    StorageError partial(ErrorCode::PARTIAL_COMMIT, "stopped");
    EXPECT_EQ(partial.severity, ErrorSeverity::CRITICAL);
    EXPECT_FALSE(partial.isRecoverable());

    EXPECT_EQ(error_utils::getErrorCategory(ErrorCode::INDEX_MISSING), ErrorCategory::INDEX);
    EXPECT_EQ(error_utils::getErrorCategory(ErrorCode::INVALID_CONFIGURATION), ErrorCategory::CONFIGURATION);
    EXPECT_EQ(error_utils::getErrorCategory(ErrorCode::INTERNAL_ERROR), ErrorCategory::GENERIC);
    EXPECT_TRUE(error_utils::isBackendError(ErrorCode::BACKEND_OPERATION_FAILED));
    EXPECT_TRUE(error_utils::isCritical(ErrorCode::PARTIAL_COMMIT));
    EXPECT_TRUE(error_utils::isCallerError(ErrorCode::INVALID_KEY));
    EXPECT_TRUE(error_utils::isCallerError(ErrorCode::UNSUPPORTED_QUERY));
    EXPECT_FALSE(error_utils::isCallerError(ErrorCode::INDEX_MISSING));
    EXPECT_FALSE(error_utils::isCallerError(ErrorCode::BACKEND_TIMEOUT));
    EXPECT_FALSE(error_utils::isCritical(ErrorCode::UNSUPPORTED_QUERY));
}

TEST(StorageErrorTest, WhatAndJsonCarryDetailsAndContext) {
    StorageError e(ErrorCode::INVALID_KEY, "Invalid key");
    e.withDetails("empty path").withContext("key", "Task:1").withUnderlyingError(ErrorCode::INVALID_DATA_FORMAT);

    std::string what = e.what();
    EXPECT_NE(what.find("INVALID_KEY"), std::string::npos);
    EXPECT_NE(what.find("empty path"), std::string::npos);
    EXPECT_EQ(e.contextValue("key").value_or(""), "Task:1");
    EXPECT_FALSE(e.contextValue("query").has_value());

    auto j = nlohmann::json::parse(e.toJson());
    EXPECT_EQ(j["code"], static_cast<int>(ErrorCode::INVALID_KEY));
    EXPECT_EQ(j["code_name"], "INVALID_KEY");
    EXPECT_EQ(j["details"], "empty path");
    EXPECT_EQ(j["context"]["key"], "Task:1");
    EXPECT_EQ(j["underlying_error_name"], "INVALID_DATA_FORMAT");

    // Raw key bytes must not break serialization.
    StorageError raw(ErrorCode::INVALID_KEY);
    raw.withContext("key", std::string("\xff\x00\x01", 3));
    EXPECT_NO_THROW(nlohmann::json::parse(raw.toJson()));
}

TEST(StorageErrorTest, TypedErrorsCarryContext) {
    PartialCommitError partial(1, 3, "Item:b", "disk full");
    EXPECT_EQ(partial.failed_index, 1u);
    EXPECT_EQ(partial.total_operations, 3u);
    EXPECT_EQ(partial.contextValue("failed_index").value_or(""), "1");
    EXPECT_NE(std::string(partial.what()).find("disk full"), std::string::npos);

    UnsupportedTypeError unsupported("score", "nested list");
    EXPECT_EQ(unsupported.contextValue("property").value_or(""), "score");

    BackendUnavailableError plain("find", "closed");
    EXPECT_FALSE(plain.underlying_error.has_value());
    EXPECT_EQ(plain.contextValue("operation").value_or(""), "find");
}

TEST(StorageErrorTest, ResultPropagatesErrors) {
    int out = 0;
    EXPECT_TRUE(doubled(4, out).isOk());
    EXPECT_EQ(out, 8);

    Status failed = doubled(-1, out);
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code, ErrorCode::OPTION_OUT_OF_RANGE);
    EXPECT_TRUE(failed.error().line_number.has_value());

    Result<int> bad = parsePositive(0);
    EXPECT_EQ(bad.valueOr(7), 7);
    EXPECT_THROW(bad.value(), StorageError);
}

TEST(ErrorContextTest, CountsAndRoutesBySeverity) {
    auto handler = std::make_shared<CountingHandler>();
    ErrorContext context(handler);

    context.reportError(ErrorCode::NON_ATOMIC_COMMIT, "first");
    context.reportError(ErrorCode::NON_ATOMIC_COMMIT, "second");
    context.reportError(StorageError(ErrorCode::ID_ALLOCATION_FAILED, "counter").withContext("kind", "Task"));
    context.reportError(ErrorCode::PARTIAL_COMMIT, "stopped");

    EXPECT_EQ(context.getErrorCount(ErrorCode::NON_ATOMIC_COMMIT), 2u);
    EXPECT_EQ(context.getErrorCount(ErrorCode::ID_ALLOCATION_FAILED), 1u);
    EXPECT_EQ(context.getErrorCount(ErrorCode::INVALID_KEY), 0u);
    EXPECT_EQ(context.getTotalErrorCount(), 4u);
    EXPECT_TRUE(context.hasRepeatedErrors(ErrorCode::NON_ATOMIC_COMMIT, 2));
    EXPECT_FALSE(context.hasRepeatedErrors(ErrorCode::NON_ATOMIC_COMMIT));

    EXPECT_EQ(handler->handled, (std::vector<ErrorCode>{ErrorCode::NON_ATOMIC_COMMIT, ErrorCode::NON_ATOMIC_COMMIT,
                                                        ErrorCode::ID_ALLOCATION_FAILED}));
    EXPECT_EQ(handler->critical, (std::vector<ErrorCode>{ErrorCode::PARTIAL_COMMIT}));

    auto recent = context.getRecentErrors(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].code, ErrorCode::ID_ALLOCATION_FAILED);
    EXPECT_EQ(recent[0].contextValue("kind").value_or(""), "Task");
    EXPECT_EQ(recent[1].code, ErrorCode::PARTIAL_COMMIT);

    context.clearErrors();
    EXPECT_EQ(context.getTotalErrorCount(), 0u);
    EXPECT_TRUE(context.getRecentErrors().empty());
}

TEST(ErrorContextTest, WarningsHaveTheirOwnHook) {
    auto handler = std::make_shared<WarningHandler>();
    ErrorContext context(handler);
    context.reportError(ErrorCode::NON_ATOMIC_COMMIT, "sequential commit");
    context.reportError(ErrorCode::BACKEND_TIMEOUT, "slow");
    EXPECT_EQ(handler->warnings, (std::vector<ErrorCode>{ErrorCode::NON_ATOMIC_COMMIT}));
    EXPECT_EQ(handler->handled, (std::vector<ErrorCode>{ErrorCode::BACKEND_TIMEOUT}));
}

TEST(ErrorContextTest, RecentErrorsAreBounded) {
    ErrorContext context;
    for (int i = 0; i < 150; ++i) {
        context.reportError(StorageError(ErrorCode::INVALID_QUERY, "q" + std::to_string(i)));
    }
    EXPECT_EQ(context.getErrorCount(ErrorCode::INVALID_QUERY), 150u);
    auto recent = context.getRecentErrors(1000);
    ASSERT_EQ(recent.size(), 100u);
    EXPECT_EQ(recent.front().message, "q50");
    EXPECT_EQ(recent.back().message, "q149");
}

TEST(ErrorContextTest, HandlerCanBeReplaced) {
    ErrorContext context;
    context.reportError(ErrorCode::NON_ATOMIC_COMMIT, "unobserved");
    auto handler = std::make_shared<CountingHandler>();
    context.setErrorHandler(handler);
    context.reportError(ErrorCode::NON_ATOMIC_COMMIT, "observed");
    EXPECT_EQ(handler->handled.size(), 1u);
    context.setErrorHandler(nullptr);
    context.reportError(ErrorCode::NON_ATOMIC_COMMIT, "unobserved again");
    EXPECT_EQ(handler->handled.size(), 1u);
}
