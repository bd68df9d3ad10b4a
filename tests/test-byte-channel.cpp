#include <gtest/gtest.h>

#include "byte-channel.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace edge_tts;

TEST(ByteChannelTest, DeliversInOrderThenEof) {
    byte_channel ch(4);
    ASSERT_TRUE(ch.write("a"));
    ASSERT_TRUE(ch.write("bc"));
    ASSERT_TRUE(ch.close());

    std::string out;
    proxy_error err;
    ASSERT_EQ(ch.read(out, err), byte_channel::READ_DATA);
    EXPECT_EQ(out, "a");
    ASSERT_EQ(ch.read(out, err), byte_channel::READ_DATA);
    EXPECT_EQ(out, "bc");
    EXPECT_EQ(ch.read(out, err), byte_channel::READ_EOF);
    EXPECT_EQ(ch.read(out, err), byte_channel::READ_EOF);
    EXPECT_EQ(ch.bytes_written(), 3u);
}

TEST(ByteChannelTest, QueuedDataDrainsBeforeAbort) {
    byte_channel ch;
    ASSERT_TRUE(ch.write("first"));
    proxy_error cause;
    set_error(cause, ERROR_KIND_SYNTHESIS, 500, "unit 3: boom");
    ASSERT_TRUE(ch.abort(cause));

    std::string out;
    proxy_error err;
    ASSERT_EQ(ch.read(out, err), byte_channel::READ_DATA);
    EXPECT_EQ(out, "first");
    ASSERT_EQ(ch.read(out, err), byte_channel::READ_ABORTED);
    EXPECT_EQ(err.kind, ERROR_KIND_SYNTHESIS);
    EXPECT_EQ(err.message, "unit 3: boom");
}

TEST(ByteChannelTest, FinishesExactlyOnce) {
    byte_channel ch;
    EXPECT_FALSE(ch.is_finished());
    EXPECT_TRUE(ch.close());
    EXPECT_TRUE(ch.is_finished());
    EXPECT_FALSE(ch.close());

    proxy_error err;
    set_error(err, ERROR_KIND_INTERNAL, 500, "late");
    EXPECT_FALSE(ch.abort(err));
    EXPECT_FALSE(ch.write("x"));

    std::string out;
    proxy_error read_err;
    EXPECT_EQ(ch.read(out, read_err), byte_channel::READ_EOF);
}

TEST(ByteChannelTest, CancelRejectsWritesAndWakesReader) {
    byte_channel ch;
    std::atomic<int> status {-1};
    proxy_error err;
    std::thread reader([&]() {
        std::string out;
        status = (int) ch.read(out, err);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.cancel();
    reader.join();

    EXPECT_EQ(status.load(), (int) byte_channel::READ_ABORTED);
    EXPECT_EQ(err.kind, ERROR_KIND_STREAM_ABORT);
    EXPECT_TRUE(ch.is_cancelled());
    EXPECT_FALSE(ch.write("x"));
}

TEST(ByteChannelTest, WriterBlocksWhenFull) {
    byte_channel ch(2);
    std::atomic<int> written {0};
    std::thread writer([&]() {
        for (int i = 0; i < 5; ++i) {
            if (!ch.write(std::to_string(i))) {
                break;
            }
            written.fetch_add(1);
        }
        ch.close();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(written.load(), 2);

    std::string got;
    std::string out;
    proxy_error err;
    while (ch.read(out, err) == byte_channel::READ_DATA) {
        got += out;
    }
    writer.join();
    EXPECT_EQ(got, "01234");
    EXPECT_EQ(written.load(), 5);
}

TEST(ByteChannelTest, CancelUnblocksFullWriter) {
    byte_channel ch(1);
    ASSERT_TRUE(ch.write("a"));
    std::atomic<bool> result {true};
    std::thread writer([&]() { result = ch.write("b"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.cancel();
    writer.join();
    EXPECT_FALSE(result.load());
}

TEST(ByteChannelTest, WaitReadyDoesNotConsume) {
    byte_channel ch;
    ASSERT_TRUE(ch.write("x"));
    proxy_error err;
    EXPECT_EQ(ch.wait_ready(err), byte_channel::READ_DATA);

    std::string out;
    ASSERT_EQ(ch.read(out, err), byte_channel::READ_DATA);
    EXPECT_EQ(out, "x");
}

TEST(ChannelGuardTest, AbortsWhenLeftUnfinished) {
    byte_channel ch;
    {
        channel_guard guard(ch);
        ASSERT_TRUE(ch.write("partial"));
    }
    std::string out;
    proxy_error err;
    ASSERT_EQ(ch.read(out, err), byte_channel::READ_DATA);
    ASSERT_EQ(ch.read(out, err), byte_channel::READ_ABORTED);
    EXPECT_EQ(err.kind, ERROR_KIND_INTERNAL);
}

TEST(ChannelGuardTest, ExplicitCloseWins) {
    byte_channel ch;
    {
        channel_guard guard(ch);
        guard.close();
        proxy_error err;
        set_error(err, ERROR_KIND_INTERNAL, 500, "ignored");
        guard.abort(err);
    }
    std::string out;
    proxy_error err;
    EXPECT_EQ(ch.read(out, err), byte_channel::READ_EOF);
}
