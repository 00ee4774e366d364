// ============================================================================
// SUBMISSION PIPELINE UNIT TESTS
// ============================================================================
// Tests for sendError, transaction creation and the uncaught exception handler
// ============================================================================

#include <gtest/gtest.h>
#include <beacon/core/submission/report_handler.hpp>
#include <beacon/core/submission/submission_pipeline.hpp>
#include "support/fake_backend.hpp"

#include <set>
#include <stdexcept>

using namespace Beacon;
using BeaconTest::FakeBackend;
using BeaconTest::activeConfig;
using BeaconTest::fixedSource;

struct RuntimeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

namespace {

SendErrorOptions withEmptyStack() {
    SendErrorOptions options;
    options.stack = Stacktrace{};
    return options;
}

AgentConfig configIgnoring(const std::string& kind) {
    AgentConfig config = activeConfig();
    config.ignore_errors.push_back(kind);
    return config;
}

} // namespace

class SubmissionPipelineTest : public ::testing::Test {
protected:
    SubmissionPipelineTest()
        : lifecycle_(backend_, fixedSource(configIgnoring("IgnoredError"))),
          pipeline_(backend_, lifecycle_, factory_) {}

    void SetUp() override {
        ASSERT_EQ(lifecycle_.initialize(), LifecycleState::ENABLED_ACTIVE);
    }

    ErrorSubmission onlySubmission() const {
        auto submissions = backend_.submissions();
        EXPECT_EQ(submissions.size(), 1u);
        return submissions.at(0);
    }

    FakeBackend backend_;
    DefaultTransactionFactory factory_;
    ConfigLifecycle lifecycle_;
    SubmissionPipeline pipeline_;
};

// ============================================================================
// NORMALIZATION TESTS
// ============================================================================

TEST_F(SubmissionPipelineTest, NativeExceptionIsSubmitted) {
    std::string id = pipeline_.sendError(std::make_exception_ptr(RuntimeError("boom")), withEmptyStack());

    ErrorSubmission submission = onlySubmission();
    EXPECT_EQ(submission.transaction.id(), id);
    EXPECT_EQ(submission.kind, "RuntimeError");
    EXPECT_EQ(submission.message, "boom");
    EXPECT_EQ(submission.transaction.getNamespace(), Namespace::HTTP_REQUEST);
    EXPECT_EQ(pipeline_.submittedCount(), 1u);
}

TEST_F(SubmissionPipelineTest, PlainValueUsesGenericKind) {
    pipeline_.sendError(ScalarValue("oops"), withEmptyStack());

    ErrorSubmission submission = onlySubmission();
    EXPECT_EQ(submission.kind, ErrorNormalizer::GENERIC_KIND);
    EXPECT_EQ(submission.message, "oops");
}

TEST_F(SubmissionPipelineTest, PrefixIsPrepended) {
    SendErrorOptions options = withEmptyStack();
    options.prefix = "ctx";

    pipeline_.sendError(std::make_exception_ptr(RuntimeError("boom")), options);

    EXPECT_EQ(onlySubmission().message, "ctx: boom");
}

TEST(SubmissionPipeline, ComposeMessage) {
    EXPECT_EQ(SubmissionPipeline::composeMessage("ctx", "boom"), "ctx: boom");
    EXPECT_EQ(SubmissionPipeline::composeMessage("", "boom"), "boom");
}

TEST_F(SubmissionPipelineTest, StackIsFormattedInOrder) {
    SendErrorOptions options;
    options.stack = Stacktrace{
        {"Billing.charge/2", SourceLocation{"lib/billing.ex", 42}, std::nullopt},
        {"Web.handle/1", std::nullopt, std::nullopt},
    };

    pipeline_.sendError(StructuredError{"ChargeError", "declined"}, options);

    ErrorSubmission submission = onlySubmission();
    ASSERT_EQ(submission.backtrace.size(), 2u);
    EXPECT_EQ(submission.backtrace[0], "Billing.charge/2 (lib/billing.ex:42)");
    EXPECT_EQ(submission.backtrace[1], "Web.handle/1");
}

TEST_F(SubmissionPipelineTest, MissingStackStillSubmits) {
    std::string id = pipeline_.sendError(ScalarValue("oops"));

    EXPECT_FALSE(id.empty());
    EXPECT_TRUE(onlySubmission().backtrace.empty());
}

// ============================================================================
// TRANSACTION TESTS
// ============================================================================

TEST_F(SubmissionPipelineTest, EveryCallCreatesItsOwnTransaction) {
    std::set<std::string> ids;
    for (int i = 0; i < 10; ++i) {
        ids.insert(pipeline_.sendError(ScalarValue(i), withEmptyStack()));
    }

    EXPECT_EQ(ids.size(), 10u);
    for (const auto& id : ids) {
        ASSERT_EQ(id.size(), 37u);
        EXPECT_EQ(id[0], '_');
        EXPECT_EQ(id[15], '4');
    }
}

TEST_F(SubmissionPipelineTest, CustomizeCallbackSeesTransaction) {
    SendErrorOptions options = withEmptyStack();
    options.ns = Namespace::BACKGROUND;
    options.customize = [](Transaction& transaction) {
        transaction.setSampleData("params", {{"id", 7}});
    };

    pipeline_.sendError(ScalarValue("oops"), options);

    ErrorSubmission submission = onlySubmission();
    EXPECT_EQ(submission.transaction.getNamespace(), Namespace::BACKGROUND);
    ASSERT_EQ(submission.transaction.sampleData().count("params"), 1u);
    EXPECT_EQ(submission.transaction.sampleData().at("params"), R"({"id": 7})");
}

TEST_F(SubmissionPipelineTest, ThrowingCustomizeCallbackDoesNotStopSubmission) {
    SendErrorOptions options = withEmptyStack();
    options.customize = [](Transaction&) { throw std::runtime_error("bad callback"); };

    std::string id;
    EXPECT_NO_THROW(id = pipeline_.sendError(ScalarValue("oops"), options));
    EXPECT_FALSE(id.empty());
}

TEST_F(SubmissionPipelineTest, CustomizeCallbackThrowingIntDoesNotEscape) {
    SendErrorOptions options = withEmptyStack();
    options.customize = [](Transaction&) { throw 42; };

    std::string id;
    EXPECT_NO_THROW(id = pipeline_.sendError(ScalarValue("oops"), options));
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(backend_.submissions().size(), 1u);
}

TEST_F(SubmissionPipelineTest, TagsAndContextAreForwarded) {
    SendErrorOptions options = withEmptyStack();
    options.tags = {{"env", "prod"}, {"n", 3}};
    options.context = RequestContext{"GET", "/checkout", {{"Accept", "text/html"}}, {{"id", "7"}}};

    pipeline_.sendError(ScalarValue("oops"), options);

    ErrorSubmission submission = onlySubmission();
    EXPECT_EQ(submission.tags, R"({"env": "prod", "n": 3})");
    ASSERT_TRUE(submission.context.has_value());
    EXPECT_EQ(submission.context->path, "/checkout");
    EXPECT_EQ(submission.context->headers.at("Accept"), "text/html");
}

TEST(Transaction, EmptyIdIsRejected) {
    EXPECT_THROW(Transaction("", Namespace::HTTP_REQUEST), std::invalid_argument);
}

TEST(Transaction, FactoryFillsMissingId) {
    DefaultTransactionFactory factory;
    EXPECT_FALSE(factory.create("", Namespace::BACKGROUND).id().empty());
    EXPECT_EQ(factory.create("given", Namespace::BACKGROUND).id(), "given");
}

// ============================================================================
// DROPPING TESTS
// ============================================================================

TEST_F(SubmissionPipelineTest, IgnoredKindsAreNotSubmitted) {
    std::string id = pipeline_.sendError(StructuredError{"IgnoredError", "noise"}, withEmptyStack());

    EXPECT_TRUE(id.empty());
    EXPECT_TRUE(backend_.submissions().empty());
}

TEST_F(SubmissionPipelineTest, BackendRejectionIsCountedNotThrown) {
    backend_.accept = false;

    std::string id = pipeline_.sendError(ScalarValue("oops"), withEmptyStack());

    EXPECT_TRUE(id.empty());
    EXPECT_EQ(pipeline_.failedCount(), 1u);
}

TEST_F(SubmissionPipelineTest, BackendExceptionIsCountedNotThrown) {
    backend_.throw_on_call = true;

    std::string id;
    EXPECT_NO_THROW(id = pipeline_.sendError(ScalarValue("oops"), withEmptyStack()));
    EXPECT_TRUE(id.empty());
    EXPECT_EQ(pipeline_.failedCount(), 1u);
}

TEST_F(SubmissionPipelineTest, NonStandardBackendExceptionIsCountedNotThrown) {
    backend_.throw_int_on_call = true;

    std::string id;
    EXPECT_NO_THROW(id = pipeline_.sendError(ScalarValue("oops"), withEmptyStack()));
    EXPECT_TRUE(id.empty());
    EXPECT_EQ(pipeline_.failedCount(), 1u);
}

TEST(SubmissionPipeline, InactiveLifecycleDoesNotSubmit) {
    AgentConfig config = activeConfig();
    config.active = false;

    FakeBackend backend;
    DefaultTransactionFactory factory;
    ConfigLifecycle lifecycle(backend, fixedSource(config));
    lifecycle.initialize();
    SubmissionPipeline pipeline(backend, lifecycle, factory);

    EXPECT_TRUE(pipeline.sendError(ScalarValue("oops"), withEmptyStack()).empty());
    EXPECT_EQ(backend.callCount(), 0u);
}

// ============================================================================
// REPORT HANDLER TESTS
// ============================================================================

TEST_F(SubmissionPipelineTest, ReportHandlerReportsInBackground) {
    ReportHandler handler(pipeline_);

    std::string id = handler.report(std::make_exception_ptr(RuntimeError("crashed")));

    EXPECT_FALSE(id.empty());
    ErrorSubmission submission = onlySubmission();
    EXPECT_EQ(submission.kind, "RuntimeError");
    EXPECT_EQ(submission.message, "Uncaught exception: crashed");
    EXPECT_EQ(submission.transaction.getNamespace(), Namespace::BACKGROUND);
    EXPECT_FALSE(submission.backtrace.empty());
}

TEST_F(SubmissionPipelineTest, ReportHandlerIgnoresNullException) {
    ReportHandler handler(pipeline_);

    EXPECT_TRUE(handler.report(std::exception_ptr()).empty());
    EXPECT_TRUE(backend_.submissions().empty());
}

TEST_F(SubmissionPipelineTest, ReportHandlerInstallAndRemove) {
    std::terminate_handler before = std::get_terminate();
    {
        ReportHandler handler(pipeline_);
        handler.add();
        EXPECT_TRUE(handler.installed());
        EXPECT_NE(std::get_terminate(), before);

        handler.add();
        EXPECT_TRUE(handler.installed());

        handler.remove();
        EXPECT_FALSE(handler.installed());
        EXPECT_EQ(std::get_terminate(), before);
    }
    EXPECT_EQ(std::get_terminate(), before);
}

TEST_F(SubmissionPipelineTest, SecondHandlerReplacesFirst) {
    std::terminate_handler before = std::get_terminate();
    ReportHandler first(pipeline_);
    ReportHandler second(pipeline_);

    first.add();
    second.add();
    EXPECT_FALSE(first.installed());
    EXPECT_TRUE(second.installed());

    second.remove();
    EXPECT_EQ(std::get_terminate(), before);
}

TEST_F(SubmissionPipelineTest, UncaughtExceptionTerminatesAfterReporting) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    EXPECT_DEATH(
        {
            ReportHandler handler(pipeline_);
            handler.add();
            try {
                throw RuntimeError("fatal");
            } catch (const std::exception&) {
                std::terminate();
            }
        },
        "");
}
