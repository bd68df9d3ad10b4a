#include <gtest/gtest.h>

#include "response-assembler.h"
#include "test-fakes.h"

#include <string>
#include <vector>

using namespace edge_tts;
using edge_tts::testing_fakes::expected_audio;
using edge_tts::testing_fakes::fake_issuer;
using edge_tts::testing_fakes::fake_synth;
using edge_tts::testing_fakes::make_units;

namespace {

struct pipeline {
    fake_issuer issuer {now_sec};
    credential_cache creds {issuer};
    fake_synth synth;
    batch_scheduler scheduler {creds, synth};
    voice_params params;
};

std::vector<std::string> drain(byte_channel & ch, byte_channel::read_status & last, proxy_error & err) {
    std::vector<std::string> chunks;
    std::string out;
    while ((last = ch.read(out, err)) == byte_channel::READ_DATA) {
        chunks.push_back(out);
    }
    return chunks;
}

}  // namespace

TEST(ResponseAssemblerTest, BufferedConcatenatesInOrder) {
    pipeline p;
    p.synth.jitter_ms = 10;

    const auto units = make_units(9);
    std::string body;
    proxy_error err;
    ASSERT_TRUE(assemble_buffered(p.scheduler, units, 10, p.params, body, err));

    std::string expected;
    for (const auto & u : units) {
        expected += expected_audio(u.content);
    }
    EXPECT_EQ(body, expected);
}

TEST(ResponseAssemblerTest, BufferedEmptyInputGivesEmptyBody) {
    pipeline p;
    std::string body = "stale";
    proxy_error err;
    ASSERT_TRUE(assemble_buffered(p.scheduler, {}, 10, p.params, body, err));
    EXPECT_TRUE(body.empty());
}

TEST(ResponseAssemblerTest, BufferedFailureReturnsNoAudio) {
    pipeline p;
    p.synth.fail_text = "u2";
    std::string body;
    proxy_error err;
    EXPECT_FALSE(assemble_buffered(p.scheduler, make_units(4), 10, p.params, body, err));
    EXPECT_TRUE(body.empty());
    EXPECT_EQ(err.kind, ERROR_KIND_SYNTHESIS);
}

TEST(ResponseAssemblerTest, StreamEmitsBatchesInOrder) {
    pipeline p;
    p.synth.base_delay_ms = 2;
    p.synth.jitter_ms = 10;

    const auto units = make_units(7);
    stream_session session(p.scheduler, units, 3, p.params);
    EXPECT_EQ(session.n_units(), 7u);
    EXPECT_EQ(session.effective(), 3);
    session.start();

    byte_channel::read_status last = byte_channel::READ_DATA;
    proxy_error err;
    const auto chunks = drain(session.channel(), last, err);

    EXPECT_EQ(last, byte_channel::READ_EOF);
    ASSERT_EQ(chunks.size(), units.size());
    for (size_t i = 0; i < units.size(); ++i) {
        EXPECT_EQ(chunks[i], expected_audio(units[i].content));
    }
    EXPECT_LE(p.synth.max_inflight, 3);

    // batches [0,1,2], [3,4,5], [6]: u6 starts only after u0..u5 finished
    std::vector<std::string> finished_before_u6;
    for (const auto & e : p.synth.events) {
        if (e.start && e.text == "u6") {
            break;
        }
        if (!e.start) {
            finished_before_u6.push_back(e.text);
        }
    }
    EXPECT_EQ(finished_before_u6.size(), 6u);
}

TEST(ResponseAssemblerTest, StreamAbortsAfterEarlierBatches) {
    pipeline p;
    p.synth.fail_text = "u4";

    const auto units = make_units(7);
    stream_session session(p.scheduler, units, 3, p.params);
    session.start();

    byte_channel::read_status last = byte_channel::READ_DATA;
    proxy_error err;
    const auto chunks = drain(session.channel(), last, err);

    EXPECT_EQ(last, byte_channel::READ_ABORTED);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], expected_audio("u0"));
    EXPECT_EQ(chunks[2], expected_audio("u2"));
    EXPECT_EQ(err.kind, ERROR_KIND_SYNTHESIS);
    EXPECT_EQ(p.synth.calls_for("u6"), 0);
}

TEST(ResponseAssemblerTest, StreamFailureBeforeFirstByteIsVisibleToWaitReady) {
    pipeline p;
    p.issuer.fail = true;

    stream_session session(p.scheduler, make_units(3), 10, p.params);
    session.start();

    proxy_error err;
    EXPECT_EQ(session.channel().wait_ready(err), byte_channel::READ_ABORTED);
    EXPECT_EQ(err.kind, ERROR_KIND_CREDENTIAL);
    EXPECT_EQ(session.channel().bytes_written(), 0u);
}

TEST(ResponseAssemblerTest, StreamWithNoUnitsClosesImmediately) {
    pipeline p;
    stream_session session(p.scheduler, {}, 10, p.params);
    EXPECT_EQ(session.effective(), 0);
    session.start();

    proxy_error err;
    EXPECT_EQ(session.channel().wait_ready(err), byte_channel::READ_EOF);
}

TEST(ResponseAssemblerTest, ProducerFinishesChannelExactlyOnce) {
    pipeline p;
    byte_channel ch(16);
    run_stream_producer(p.scheduler, make_units(4), 10, p.params, ch);

    EXPECT_TRUE(ch.is_finished());
    EXPECT_FALSE(ch.close());

    byte_channel::read_status last = byte_channel::READ_DATA;
    proxy_error err;
    EXPECT_EQ(drain(ch, last, err).size(), 4u);
    EXPECT_EQ(last, byte_channel::READ_EOF);
}

TEST(ResponseAssemblerTest, DroppingSessionMidStreamStopsProducer) {
    pipeline p;
    p.synth.base_delay_ms = 10;

    {
        stream_session session(p.scheduler, make_units(40), 5, p.params, 1);
        session.start();
        std::string out;
        proxy_error err;
        ASSERT_EQ(session.channel().read(out, err), byte_channel::READ_DATA);
        EXPECT_EQ(out, expected_audio("u0"));
    }
    // the destructor cancelled and joined; later batches never started
    EXPECT_LT(p.synth.n_calls(), 40u);
}
