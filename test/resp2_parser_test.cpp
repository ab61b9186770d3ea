#include <gtest/gtest.h>

#include <rediswire/resp2/parser.hpp>

#include "test_util.hpp"

#include <cstring>
#include <string>
#include <string_view>
#include <vector>

using namespace rediswire;
using namespace rediswire::resp2;
using namespace rediswire::test_util;
using namespace std::string_view_literals;

namespace {

auto append(parser& p, std::string_view data) -> void {
  if (data.empty()) {
    return;
  }
  auto w = p.prepare(data.size());
  std::memcpy(w.data(), data.data(), data.size());
  p.commit(data.size());
}

// ---- decode_prefix ----

TEST(resp2_parser_test, decode_prefix_reports_consumed_bytes) {
  auto r = decode_prefix("+OK\r\n:1\r\n");
  ASSERT_TRUE(r);
  ASSERT_FALSE(r->needs_more());
  EXPECT_EQ(r->value.value, simple("OK"));
  EXPECT_EQ(r->value.consumed, 5u);

  auto r2 = decode_prefix("+OK\r\n:1\r\n"sv.substr(r->value.consumed));
  ASSERT_TRUE(r2);
  EXPECT_EQ(r2->value.value, num(1));
  EXPECT_EQ(r2->value.consumed, 4u);
}

TEST(resp2_parser_test, decode_prefix_consumed_covers_nested_frame) {
  constexpr auto wire = "*2\r\n$3\r\nfoo\r\n*1\r\n:7\r\n"sv;
  auto r = decode_prefix(std::string(wire) + "+next\r\n");
  ASSERT_TRUE(r);
  EXPECT_EQ(r->value.consumed, wire.size());
  EXPECT_EQ(r->value.value, arr({bulk("foo"), arr({num(7)})}));
}

TEST(resp2_parser_test, every_strict_prefix_of_a_valid_frame_needs_more) {
  std::vector<std::string_view> frames{
    "+OK\r\n",
    "-ERR unknown command\r\n",
    "-ERR\n \nspaced\r\n",
    ":-9223372036854775808\r\n",
    "$5\r\nhello\r\n",
    "$0\r\n\r\n",
    "$-1\r\n",
    "*-1\r\n",
    "*0\r\n",
    "*3\r\n:1\r\n$2\r\nab\r\n*1\r\n+x\r\n",
  };

  for (auto wire : frames) {
    for (std::size_t n = 0; n < wire.size(); ++n) {
      auto r = decode_prefix(wire.substr(0, n));
      ASSERT_TRUE(r) << "prefix " << n << " of " << wire;
      EXPECT_TRUE(r->needs_more()) << "prefix " << n << " of " << wire;
      EXPECT_GE(r->needed, 1u);
    }
    auto full = decode_prefix(wire);
    ASSERT_TRUE(full) << wire;
    ASSERT_FALSE(full->needs_more()) << wire;
    EXPECT_EQ(full->value.consumed, wire.size());
  }
}

TEST(resp2_parser_test, decode_prefix_hint_is_exact_for_bulk_payload) {
  auto r = decode_prefix("$10\r\nhel");
  ASSERT_TRUE(r);
  ASSERT_TRUE(r->needs_more());
  EXPECT_EQ(r->needed, 9u);  // 7 payload bytes + CRLF
}

TEST(resp2_parser_test, decode_prefix_rejects_invalid_before_end_of_input) {
  auto r1 = decode_prefix("+OK\rX");
  ASSERT_FALSE(r1);
  EXPECT_EQ(r1.error(), error::malformed_terminator);

  // Overflow is known as soon as the digits end, terminator or not.
  auto r2 = decode_prefix(":99999999999999999999\r");
  ASSERT_FALSE(r2);
  EXPECT_EQ(r2.error(), error::overflow);

  auto r3 = decode_prefix("*1\r\n?");
  ASSERT_FALSE(r3);
  EXPECT_EQ(r3.error(), error::unrecognized_type);

  auto r4 = decode_prefix("-err");
  ASSERT_FALSE(r4);
  EXPECT_EQ(r4.error(), error::empty_kind);
}

TEST(resp2_parser_test, decode_prefix_reports_overflow_without_terminator) {
  auto r = decode_prefix(":92233720368547758080");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), error::overflow);

  // Still within range: more digits or the terminator may follow.
  auto r2 = decode_prefix(":9223372036854775807");
  ASSERT_TRUE(r2);
  EXPECT_TRUE(r2->needs_more());
}

TEST(resp2_parser_test, decode_prefix_limits_apply_to_incomplete_input) {
  decoder_config cfg;
  cfg.max_bulk_bytes = 16;
  auto r = decode_prefix("$17\r\n", cfg);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), error::limit_exceeded);

  auto r1 = decode_prefix("$17", cfg);
  ASSERT_FALSE(r1);
  EXPECT_EQ(r1.error(), error::limit_exceeded);

  cfg.max_array_len = 2;
  auto r2 = decode_prefix("*3", cfg);
  ASSERT_FALSE(r2);
  EXPECT_EQ(r2.error(), error::limit_exceeded);

  cfg.max_line_bytes = 4;
  auto r3 = decode_prefix("+abcdefgh", cfg);
  ASSERT_FALSE(r3);
  EXPECT_EQ(r3.error(), error::limit_exceeded);
}

// ---- parser ----

TEST(resp2_parser_test, parse_simple_string_ok) {
  parser p;
  append(p, "+OK\r\n");

  auto r = p.parse_one();
  ASSERT_TRUE(r);
  ASSERT_FALSE(r->needs_more());
  EXPECT_EQ(r->value, simple("OK"));
  EXPECT_EQ(p.buffered(), 0u);
}

TEST(resp2_parser_test, need_more_data_consumes_nothing) {
  parser p;
  append(p, "+OK\r");

  auto r = p.parse_one();
  ASSERT_TRUE(r);
  EXPECT_TRUE(r->needs_more());
  EXPECT_EQ(p.buffered(), 4u);
  EXPECT_FALSE(p.failed());
}

TEST(resp2_parser_test, incremental_feed_completes_message) {
  parser p;
  p.feed("+O");

  auto r1 = p.parse_one();
  ASSERT_TRUE(r1);
  EXPECT_TRUE(r1->needs_more());

  p.feed("K\r\n");
  auto r2 = p.parse_one();
  ASSERT_TRUE(r2);
  ASSERT_FALSE(r2->needs_more());
  EXPECT_EQ(r2->value, simple("OK"));
}

TEST(resp2_parser_test, bulk_payload_split_across_feeds) {
  parser p;
  p.feed("$5\r\nhe");

  auto r1 = p.parse_one();
  ASSERT_TRUE(r1);
  ASSERT_TRUE(r1->needs_more());
  EXPECT_EQ(r1->needed, 5u);

  // Not enough yet: answered from the remembered hint.
  p.feed("ll");
  auto r2 = p.parse_one();
  ASSERT_TRUE(r2);
  ASSERT_TRUE(r2->needs_more());
  EXPECT_EQ(r2->needed, 3u);

  p.feed("o\r\n");
  auto r3 = p.parse_one();
  ASSERT_TRUE(r3);
  ASSERT_FALSE(r3->needs_more());
  EXPECT_EQ(r3->value, bulk("hello"));
}

TEST(resp2_parser_test, parse_multiple_messages_from_one_feed) {
  parser p;
  p.feed("+OK\r\n:1\r\n$-1\r\n*-1\r\n");

  std::vector<message> out;
  while (true) {
    auto r = p.parse_one();
    ASSERT_TRUE(r);
    if (r->needs_more()) {
      break;
    }
    out.push_back(std::move(r->value));
  }

  ASSERT_EQ(out.size(), 4u);
  EXPECT_EQ(out[0], simple("OK"));
  EXPECT_EQ(out[1], num(1));
  EXPECT_EQ(out[2], nil());
  EXPECT_EQ(out[3], nil_array());
  EXPECT_EQ(p.buffered(), 0u);
}

TEST(resp2_parser_test, byte_at_a_time_feeding_frames_pipeline) {
  constexpr auto wire =
    "*2\r\n$3\r\nGET\r\n$3\r\nkey\r\n"
    "-WRONGTYPE bad\r\n"
    ":42\r\n"
    "*2\r\n*1\r\n:1\r\n$-1\r\n"sv;

  parser p;
  std::vector<message> out;
  for (char c : wire) {
    p.feed(std::string_view{&c, 1});
    auto r = p.parse_one();
    ASSERT_TRUE(r);
    if (!r->needs_more()) {
      out.push_back(std::move(r->value));
    }
  }

  ASSERT_EQ(out.size(), 4u);
  EXPECT_EQ(out[0], arr({bulk("GET"), bulk("key")}));
  EXPECT_EQ(out[1], err("WRONGTYPE", "bad"));
  EXPECT_EQ(out[2], num(42));
  EXPECT_EQ(out[3], arr({arr({num(1)}), nil()}));
  EXPECT_EQ(p.buffered(), 0u);
}

TEST(resp2_parser_test, protocol_error_marks_failed) {
  parser p;
  p.feed("?oops\r\n");

  auto r = p.parse_one();
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), error::unrecognized_type);
  EXPECT_TRUE(p.failed());

  p.feed("+OK\r\n");
  auto r2 = p.parse_one();
  ASSERT_FALSE(r2);
  EXPECT_EQ(r2.error(), error::parser_failed);
  EXPECT_TRUE(p.failed());
}

TEST(resp2_parser_test, reset_clears_failed_state) {
  parser p;
  p.feed("?oops\r\n");

  auto r = p.parse_one();
  ASSERT_FALSE(r);
  EXPECT_TRUE(p.failed());

  p.reset();
  EXPECT_FALSE(p.failed());
  EXPECT_EQ(p.buffered(), 0u);

  p.feed("+OK\r\n");
  auto r2 = p.parse_one();
  ASSERT_TRUE(r2);
  EXPECT_EQ(r2->value, simple("OK"));
}

TEST(resp2_parser_test, protocol_error_on_bulk_string_bad_trailer) {
  parser p;
  p.feed("$5\r\nhelloX\r\n");

  auto r = p.parse_one();
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), error::malformed_terminator);
  EXPECT_TRUE(p.failed());
}

TEST(resp2_parser_test, message_outlives_buffer_reuse) {
  parser p;
  p.feed("$5\r\nhello\r\n");
  auto r = p.parse_one();
  ASSERT_TRUE(r);
  auto kept = std::move(r->value);

  // Overwrite the region the payload was read from.
  p.feed("$5\r\nworld\r\n");
  auto r2 = p.parse_one();
  ASSERT_TRUE(r2);

  EXPECT_EQ(kept, bulk("hello"));
  EXPECT_EQ(r2->value, bulk("world"));
}

TEST(resp2_parser_test, endless_error_separator_hits_line_limit) {
  decoder_config cfg;
  cfg.max_line_bytes = 8;
  parser p{cfg};

  p.feed("-ERR");
  auto r = p.parse_one();
  ASSERT_TRUE(r);
  EXPECT_TRUE(r->needs_more());

  // The separator run alone may not keep the frame open past the line limit.
  std::size_t chunks = 0;
  while (!p.failed() && chunks < 1000) {
    p.feed(std::string(16, ' '));
    auto step = p.parse_one();
    ++chunks;
    if (!step) {
      EXPECT_EQ(step.error(), error::limit_exceeded);
    }
  }
  EXPECT_TRUE(p.failed());
  EXPECT_EQ(chunks, 1u);
  EXPECT_LE(p.buffered(), 4u + 16u);
}

TEST(resp2_parser_test, parser_uses_its_config) {
  decoder_config cfg;
  cfg.max_depth = 2;
  parser p{cfg};
  EXPECT_EQ(p.config().max_depth, 2u);

  p.feed(nested_arrays(2));
  auto r = p.parse_one();
  ASSERT_TRUE(r);
  ASSERT_FALSE(r->needs_more());

  p.feed(nested_arrays(3));
  auto r2 = p.parse_one();
  ASSERT_FALSE(r2);
  EXPECT_EQ(r2.error(), error::recursion_limit_exceeded);
}

}  // namespace
