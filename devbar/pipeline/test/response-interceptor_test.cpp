#include "devbar/response-interceptor.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "devbar/codec-registry.hpp"
#include "devbar/encoding.hpp"
#include "devbar/http-header.hpp"
#include "devbar/raw-chars.hpp"
#include "devbar/response-event.hpp"
#include "devbar/toolbar-config.hpp"
#include "log-capture.hpp"

namespace devbar {

namespace {

constexpr std::string_view kHtml = "<html><body>Hi</body></html>";
constexpr std::string_view kFragment = "<div>X</div>";

std::string Gzip(std::string_view plain) {
  RawChars out;
  CodecRegistry::Global().encode(Encoding::gzip, plain, out);
  return std::string(std::string_view(out));
}

ResponseStart HtmlStart(http::HeaderList extra = {}) {
  ResponseStart start{.status = http::StatusCodeOK, .headers = {{"Content-Type", "text/html; charset=utf-8"}}};
  start.headers.insert(start.headers.end(), extra.begin(), extra.end());
  return start;
}

ResponseBody Body(std::string_view data, bool moreBody = false) {
  return ResponseBody{.body = std::string(data), .moreBody = moreBody};
}

class ResponseInterceptorTest : public ::testing::Test {
 protected:
  ResponseInterceptor &makeInterceptor(std::string path = "/", const CodecRegistry &registry = CodecRegistry::Global(),
                                       std::string method = "GET") {
    _interceptor.emplace_back(std::make_unique<ResponseInterceptor>(
        config, std::move(method), std::move(path), [this](ResponseEvent event) { events.push_back(std::move(event)); },
        [this](std::string_view plainBody, const ResponseStart &) {
          providedBodies.emplace_back(plainBody);
          if (providerThrows) {
            throw std::runtime_error("panel failure");
          }
          return rendered;
        },
        registry));
    return *_interceptor.back();
  }

  // Feeds all events to a fresh interceptor and returns what was sent downstream.
  std::vector<ResponseEvent> run(std::vector<ResponseEvent> input, std::string path = "/") {
    auto &interceptor = makeInterceptor(std::move(path));
    for (auto &event : input) {
      interceptor.onEvent(std::move(event));
    }
    return std::exchange(events, {});
  }

  [[nodiscard]] const ResponseStart &startAt(std::size_t pos) const { return std::get<ResponseStart>(events.at(pos)); }

  [[nodiscard]] const ResponseBody &bodyAt(std::size_t pos) const { return std::get<ResponseBody>(events.at(pos)); }

  ToolbarConfig config;
  RenderedToolbar rendered{.fragment = std::string(kFragment), .extraHeaders = {}};
  bool providerThrows{false};
  std::vector<std::string> providedBodies;
  std::vector<ResponseEvent> events;

 private:
  std::vector<std::unique_ptr<ResponseInterceptor>> _interceptor;
};

}  // namespace

TEST_F(ResponseInterceptorTest, SimpleInjection) {
  auto &interceptor = makeInterceptor();
  interceptor.onEvent(HtmlStart({{"Content-Length", "28"}}));
  EXPECT_TRUE(events.empty());
  interceptor.onEvent(Body(kHtml));

  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(bodyAt(1).body, "<html><body>Hi<div>X</div></body></html>");
  EXPECT_FALSE(bodyAt(1).moreBody);
  EXPECT_EQ(startAt(0).status, http::StatusCodeOK);
  EXPECT_EQ(startAt(0).headers,
            (http::HeaderList{{"Content-Type", "text/html; charset=utf-8"}, {"Content-Length", "40"}}));
  EXPECT_EQ(providedBodies, std::vector<std::string>{std::string(kHtml)});
  EXPECT_TRUE(interceptor.injected());
  EXPECT_EQ(interceptor.phase(), ResponseInterceptor::Phase::Emitted);
  EXPECT_EQ(interceptor.bodyBytesReceived(), kHtml.size());
}

TEST_F(ResponseInterceptorTest, ChunkedBodyIsBufferedUntilLastChunk) {
  auto &interceptor = makeInterceptor();
  interceptor.onEvent(HtmlStart({{"Transfer-Encoding", "chunked"}}));
  interceptor.onEvent(Body("<html><body>", true));
  interceptor.onEvent(Body("Hi", true));
  interceptor.onEvent(Body("</body>", true));
  EXPECT_TRUE(events.empty());
  EXPECT_EQ(interceptor.phase(), ResponseInterceptor::Phase::Capturing);
  interceptor.onEvent(Body("</html>", false));

  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(bodyAt(1).body, "<html><body>Hi<div>X</div></body></html>");
  EXPECT_FALSE(http::HasHeader(startAt(0).headers, "Transfer-Encoding"));
  EXPECT_EQ(http::FindHeaderValue(startAt(0).headers, "Content-Length"), std::string_view("40"));
}

TEST_F(ResponseInterceptorTest, GzipEncodedHtml) {
  const std::string compressed = Gzip(kHtml);
  const auto out =
      run({HtmlStart({{"Content-Encoding", "gzip"}, {"Content-Length", std::to_string(compressed.size())}}),
           Body(compressed.substr(0, 5), true), Body(compressed.substr(5), false)});

  ASSERT_EQ(out.size(), 2U);
  const auto &start = std::get<ResponseStart>(out[0]);
  const auto &body = std::get<ResponseBody>(out[1]);
  ASSERT_EQ(providedBodies.size(), 1U);
  EXPECT_EQ(providedBodies[0], kHtml);
  EXPECT_EQ(body.body, "<html><body>Hi<div>X</div></body></html>");
  EXPECT_FALSE(http::HasHeader(start.headers, "Content-Encoding"));
  EXPECT_EQ(http::FindHeaderValue(start.headers, "Content-Length"), std::to_string(body.body.size()));
}

TEST_F(ResponseInterceptorTest, GzipIdentityStack) {
  const std::string compressed = Gzip(kHtml);
  const auto out = run({HtmlStart({{"Content-Encoding", "gzip, identity"}}), Body(compressed)});
  ASSERT_EQ(out.size(), 2U);
  EXPECT_EQ(std::get<ResponseBody>(out[1]).body, "<html><body>Hi<div>X</div></body></html>");
  EXPECT_FALSE(http::HasHeader(std::get<ResponseStart>(out[0]).headers, "Content-Encoding"));
}

TEST_F(ResponseInterceptorTest, CorruptedGzipIsPassedThroughUnchanged) {
  std::string corrupted = Gzip(std::string(500, 'z'));
  corrupted[corrupted.size() / 2] ^= 0x5A;
  corrupted[(corrupted.size() / 2) + 1] ^= 0x5A;
  const ResponseStart start =
      HtmlStart({{"Content-Encoding", "gzip"}, {"Content-Length", std::to_string(corrupted.size())}});

  std::vector<ResponseEvent> out;
  EXPECT_NO_THROW(out = run({start, Body(corrupted)}));

  ASSERT_EQ(out.size(), 2U);
  EXPECT_EQ(std::get<ResponseStart>(out[0]), start);
  EXPECT_EQ(std::get<ResponseBody>(out[1]), Body(corrupted));
  EXPECT_TRUE(providedBodies.empty());
}

TEST_F(ResponseInterceptorTest, UnavailableZstdIsPassedThroughWithDebugLog) {
  const CodecRegistry registry{Encoding::zstd};
  const std::string body = "\x28\xB5\x2F\xFD some zstd frame";
  const ResponseStart start = HtmlStart({{"Content-Encoding", "zstd"}});

  test::LogCapture logs;
  auto &interceptor = makeInterceptor("/", registry);
  interceptor.onEvent(start);
  interceptor.onEvent(Body(body));

  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(startAt(0), start);
  EXPECT_EQ(bodyAt(1), Body(body));
  EXPECT_FALSE(interceptor.injected());

  const std::string contents = logs.contents();
  EXPECT_NE(contents.find("debug Content coding 'zstd' is not available"), std::string::npos) << contents;
}

TEST_F(ResponseInterceptorTest, NonHtmlIsStreamedEventByEvent) {
  auto &interceptor = makeInterceptor();
  const ResponseStart start{.status = 200, .headers = {{"Content-Type", "application/json"}, {"Content-Length", "9"}}};
  interceptor.onEvent(start);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(startAt(0), start);

  interceptor.onEvent(Body("{\"a\":", true));
  ASSERT_EQ(events.size(), 2U);
  interceptor.onEvent(Body("1}", true));
  interceptor.onEvent(Body("", false));
  ASSERT_EQ(events.size(), 4U);
  EXPECT_EQ(bodyAt(1), Body("{\"a\":", true));
  EXPECT_EQ(bodyAt(2), Body("1}", true));
  EXPECT_EQ(bodyAt(3), Body("", false));

  EXPECT_EQ(interceptor.phase(), ResponseInterceptor::Phase::Streaming);
  EXPECT_EQ(interceptor.eligibility(), Eligibility::notHtml);
  EXPECT_EQ(interceptor.bodyBytesReceived(), 7U);
  EXPECT_EQ(interceptor.status(), 200);
  EXPECT_TRUE(providedBodies.empty());
}

TEST_F(ResponseInterceptorTest, ExcludedPathIsIdempotent) {
  config.excludedPathPrefixes = {"/static"};
  for (std::string_view path : {"/_debug_toolbar", "/_debug_toolbar/requests/1", "/static/page.html"}) {
    SCOPED_TRACE(path);
    const std::vector<ResponseEvent> input{HtmlStart(), Body("<html><body>", true), Body("</body></html>", false)};
    EXPECT_EQ(run(input, std::string(path)), input);
  }
  EXPECT_TRUE(providedBodies.empty());
}

TEST_F(ResponseInterceptorTest, DisabledIsIdempotent) {
  config.enabled = false;
  const std::vector<ResponseEvent> input{HtmlStart(), Body(kHtml)};
  EXPECT_EQ(run(input), input);
}

TEST_F(ResponseInterceptorTest, NoBodyStatusIsStreamed) {
  const std::vector<ResponseEvent> input{ResponseStart{.status = 304, .headers = {{"Content-Type", "text/html"}}},
                                         Body("")};
  EXPECT_EQ(run(input), input);
}

TEST_F(ResponseInterceptorTest, ContentLengthMatchesBodyBytes) {
  rendered.fragment = "<div>caf\xC3\xA9 \xE2\x82\xAC</div>";
  const auto out = run({HtmlStart({{"content-length", "28"}, {"Content-Length", "28"}}), Body(kHtml)});
  ASSERT_EQ(out.size(), 2U);
  const auto &headers = std::get<ResponseStart>(out[0]).headers;
  const auto &body = std::get<ResponseBody>(out[1]).body;
  EXPECT_EQ(http::JoinHeaderValues(headers, "Content-Length"), std::to_string(body.size()));
  EXPECT_EQ(body.size(), kHtml.size() + rendered.fragment.size());
}

TEST_F(ResponseInterceptorTest, ExtraHeadersOnlyOnRewrittenResponse) {
  rendered.extraHeaders = {{"Server-Timing", "total;dur=3.20"}};
  auto out = run({HtmlStart(), Body(kHtml)});
  EXPECT_EQ(http::FindHeaderValue(std::get<ResponseStart>(out[0]).headers, "Server-Timing"),
            std::string_view("total;dur=3.20"));
}

TEST_F(ResponseInterceptorTest, NonUtf8HtmlIsPassedThrough) {
  const std::vector<ResponseEvent> input{HtmlStart(), Body("<html><body>\xC3\x28</body></html>")};
  EXPECT_EQ(run(input), input);
  EXPECT_TRUE(providedBodies.empty());
}

TEST_F(ResponseInterceptorTest, ProviderFailureSendsOriginal) {
  providerThrows = true;
  const std::vector<ResponseEvent> input{HtmlStart({{"Content-Length", "28"}}), Body(kHtml)};
  std::vector<ResponseEvent> out;
  EXPECT_NO_THROW(out = run(input));
  EXPECT_EQ(out, input);
}

TEST_F(ResponseInterceptorTest, DoubleStartPassesCapturedDataThrough) {
  auto &interceptor = makeInterceptor();
  interceptor.onEvent(HtmlStart());
  interceptor.onEvent(Body("<html>", true));
  EXPECT_TRUE(events.empty());

  interceptor.onEvent(ResponseStart{.status = 500, .headers = {}});
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(startAt(0), HtmlStart());
  EXPECT_EQ(bodyAt(1), Body("<html>", true));

  interceptor.onEvent(Body("</html>", false));
  ASSERT_EQ(events.size(), 3U);
  EXPECT_EQ(bodyAt(2), Body("</html>", false));
  EXPECT_EQ(interceptor.status(), http::StatusCodeOK);
  EXPECT_FALSE(interceptor.injected());
  EXPECT_TRUE(providedBodies.empty());
}

TEST_F(ResponseInterceptorTest, StartWhileStreamingIsDropped) {
  auto &interceptor = makeInterceptor();
  const ResponseStart json{.status = http::StatusCodeOK, .headers = {{"Content-Type", "application/json"}}};
  interceptor.onEvent(json);
  interceptor.onEvent(HtmlStart());
  interceptor.onEvent(Body("{}"));
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(startAt(0), json);
  EXPECT_EQ(bodyAt(1), Body("{}"));
}

TEST_F(ResponseInterceptorTest, HeadResponseIsStreamed) {
  auto &interceptor = makeInterceptor("/", CodecRegistry::Global(), "HEAD");
  const std::vector<ResponseEvent> input{HtmlStart({{"Content-Length", "28"}}), Body("")};
  for (const auto &event : input) {
    interceptor.onEvent(event);
  }
  EXPECT_EQ(events, input);
  EXPECT_EQ(interceptor.eligibility(), Eligibility::noBody);
  EXPECT_TRUE(providedBodies.empty());
}

TEST_F(ResponseInterceptorTest, DeclaredLengthAboveLimitIsStreamed) {
  config.maxBodyBytes = 10;
  auto &interceptor = makeInterceptor();
  interceptor.onEvent(HtmlStart({{"Content-Length", "28"}}));
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(interceptor.eligibility(), Eligibility::tooLarge);
  interceptor.onEvent(Body(kHtml));
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(bodyAt(1), Body(kHtml));
}

TEST_F(ResponseInterceptorTest, BufferAboveLimitFallsBackToStreaming) {
  config.maxBodyBytes = 10;
  auto &interceptor = makeInterceptor();
  interceptor.onEvent(HtmlStart());
  interceptor.onEvent(Body("12345678", true));
  EXPECT_TRUE(events.empty());

  interceptor.onEvent(Body("9abc", true));
  ASSERT_EQ(events.size(), 3U);
  EXPECT_EQ(startAt(0), HtmlStart());
  EXPECT_EQ(bodyAt(1), Body("12345678", true));
  EXPECT_EQ(bodyAt(2), Body("9abc", true));
  EXPECT_EQ(interceptor.phase(), ResponseInterceptor::Phase::Streaming);
  EXPECT_EQ(interceptor.eligibility(), Eligibility::tooLarge);

  interceptor.onEvent(Body("", false));
  ASSERT_EQ(events.size(), 4U);
  EXPECT_EQ(bodyAt(3), Body("", false));
  EXPECT_TRUE(providedBodies.empty());
}

TEST_F(ResponseInterceptorTest, CancelSuppressesWrites) {
  auto &interceptor = makeInterceptor();
  interceptor.onEvent(HtmlStart());
  interceptor.onEvent(Body("<html><body>", true));
  interceptor.cancel();
  interceptor.onEvent(Body("</body></html>", false));

  EXPECT_TRUE(events.empty());
  EXPECT_TRUE(providedBodies.empty());
  EXPECT_EQ(interceptor.phase(), ResponseInterceptor::Phase::Cancelled);
  EXPECT_FALSE(interceptor.flushOriginal());
  EXPECT_TRUE(events.empty());
}

TEST_F(ResponseInterceptorTest, FlushOriginalEmitsCapturedResponse) {
  auto &interceptor = makeInterceptor();
  EXPECT_FALSE(interceptor.flushOriginal());
  interceptor.onEvent(HtmlStart({{"Content-Length", "28"}}));
  interceptor.onEvent(Body("<html><body>", true));
  interceptor.onEvent(Body("Hi", true));

  EXPECT_TRUE(interceptor.flushOriginal());
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(startAt(0), HtmlStart({{"Content-Length", "28"}}));
  EXPECT_EQ(bodyAt(1), Body("<html><body>Hi", false));
  EXPECT_FALSE(interceptor.flushOriginal());
  EXPECT_TRUE(interceptor.headersSent());
}

TEST_F(ResponseInterceptorTest, OtherEventsFollowBufferedBody) {
  const ResponseOther trailers{.type = "http.response.trailers", .payload = "x-checksum: 1"};
  const auto out = run({HtmlStart(), Body("<body>", true), trailers, Body("</body>", false)});
  ASSERT_EQ(out.size(), 3U);
  EXPECT_EQ(std::get<ResponseBody>(out[1]).body, "<body><div>X</div></body>");
  EXPECT_EQ(std::get<ResponseOther>(out[2]), trailers);
}

TEST_F(ResponseInterceptorTest, TransportFailurePropagates) {
  ResponseInterceptor interceptor(
      config, "GET", "/", [](const ResponseEvent &) { throw std::runtime_error("connection reset"); }, nullptr);
  interceptor.onEvent(HtmlStart());
  EXPECT_THROW(interceptor.onEvent(Body(kHtml)), std::runtime_error);
}

TEST_F(ResponseInterceptorTest, SenderForwardsToInterceptor) {
  auto &interceptor = makeInterceptor();
  const Send send = interceptor.sender();
  send(HtmlStart());
  send(Body(kHtml));
  ASSERT_EQ(events.size(), 2U);
  EXPECT_TRUE(interceptor.injected());
}

}  // namespace devbar
