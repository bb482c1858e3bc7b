#include <gtest/gtest.h>

#include <speedline/core/upload_accountant.hpp>

#include "support/fakes.hpp"
#include "support/log_capture.hpp"

#include <stdexcept>
#include <vector>

using namespace speedline;
using namespace speedline::test_support;

namespace
{

constexpr std::uint64_t mib = 1024 * 1024;

class UploadAccountantTest : public ::testing::Test
{
protected:
    upload_accountant make(std::uint64_t max)
    {
        return upload_accountant{source, max, [this](const upload_report& r) { reports.push_back(r); }, &observer};
    }

    void feed(upload_accountant& accountant, std::size_t fragment_size, std::size_t count)
    {
        std::vector<std::uint8_t> fragment(fragment_size, 0xAB);
        for (std::size_t i = 0; i < count; ++i)
            accountant.on_data(fragment);
    }

    recording_source source;
    recording_observer observer;
    std::vector<upload_report> reports;
};

} // namespace

TEST_F(UploadAccountantTest, CountsBytesUntilEnd)
{
    auto accountant = make(100 * mib);
    accountant.start();

    feed(accountant, 64 * 1024, 16);
    accountant.on_end();

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].state, transfer_state::completed);
    EXPECT_EQ(reports[0].bytes, mib);
    EXPECT_FALSE(reports[0].error);
    EXPECT_EQ(source.pauses, 0u);
    EXPECT_EQ(source.destroys, 0u);
}

TEST_F(UploadAccountantTest, EmptyUploadCompletesWithZeroBytes)
{
    auto accountant = make(100 * mib);
    accountant.start();
    accountant.on_end();

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].state, transfer_state::completed);
    EXPECT_EQ(reports[0].bytes, 0u);
}

TEST_F(UploadAccountantTest, ExactlyAtCeilingIsAccepted)
{
    auto accountant = make(1000);
    accountant.start();
    feed(accountant, 500, 2);
    accountant.on_end();

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].state, transfer_state::completed);
    EXPECT_EQ(reports[0].bytes, 1000u);
}

TEST_F(UploadAccountantTest, OversizedUploadIsRejectedOnce)
{
    log_capture logs;
    auto accountant = make(100 * mib);
    accountant.start();

    // 150 MiB in 1 MiB fragments
    feed(accountant, mib, 150);
    accountant.on_end();
    accountant.on_abort();

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].state, transfer_state::oversized);
    EXPECT_EQ(reports[0].max_bytes, 100 * mib);
    EXPECT_EQ(reports[0].error, transfer_errc::size_violation);
    EXPECT_GT(reports[0].bytes, 100 * mib);
    EXPECT_LE(reports[0].bytes, 101 * mib);

    EXPECT_EQ(source.pauses, 1u);
    EXPECT_EQ(source.destroys, 1u);
    EXPECT_EQ(accountant.bytes(), reports[0].bytes);
    EXPECT_EQ(logs.count(LogLevel::Warning, "/upload too_large"), 1u);
    EXPECT_EQ(logs.count(LogLevel::Warning, "/upload abort"), 0u);
}

TEST_F(UploadAccountantTest, SingleFragmentOverCeiling)
{
    auto accountant = make(10);
    accountant.start();
    feed(accountant, 11, 1);

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].state, transfer_state::oversized);
    EXPECT_EQ(reports[0].bytes, 11u);
}

TEST_F(UploadAccountantTest, AbortProducesNoReply)
{
    log_capture logs;
    auto accountant = make(100 * mib);
    accountant.start();

    feed(accountant, 500, 1);
    accountant.on_abort();
    accountant.on_abort();
    accountant.on_end();

    EXPECT_TRUE(reports.empty());
    EXPECT_EQ(accountant.session().state(), transfer_state::aborted);
    EXPECT_EQ(accountant.bytes(), 500u);
    EXPECT_EQ(logs.count(LogLevel::Warning, "/upload abort"), 1u);
    ASSERT_EQ(observer.finished.size(), 1u);
    EXPECT_EQ(observer.finished.front(), transfer_state::aborted);
}

TEST_F(UploadAccountantTest, StreamErrorRepliesWithFailure)
{
    log_capture logs;
    auto accountant = make(100 * mib);
    accountant.start();

    feed(accountant, 100, 1);
    accountant.on_error("bad chunk encoding");

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].state, transfer_state::errored);
    EXPECT_EQ(reports[0].error, transfer_errc::transport_error);
    EXPECT_EQ(logs.count(LogLevel::Error, "/upload error"), 1u);
}

TEST_F(UploadAccountantTest, NotificationsBeforeStartAreIgnored)
{
    auto accountant = make(100);
    feed(accountant, 200, 1);
    accountant.on_end();

    EXPECT_FALSE(accountant.started());
    EXPECT_TRUE(reports.empty());
    EXPECT_EQ(source.pauses, 0u);
}

TEST_F(UploadAccountantTest, ThrowingReplyHandlerIsContained)
{
    recording_source local_source;
    upload_accountant accountant{local_source, 100, [](const upload_report&) {
        throw std::runtime_error{"socket gone"};
    }};
    accountant.start();

    EXPECT_NO_THROW(accountant.on_end());
    EXPECT_EQ(accountant.session().state(), transfer_state::completed);
}
