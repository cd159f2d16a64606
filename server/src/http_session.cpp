/*
 * 설명: HTTP 요청을 읽어 /c 생성 경로와 단축 토큰 확장 경로로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/link_flow_test.cpp
 */
#include "smolink/http_session.hpp"

#include <exception>
#include <optional>
#include <utility>

#include <boost/beast/version.hpp>

#include "smolink/api_response.hpp"
#include "smolink/db_client.hpp"
#include "smolink/uri.hpp"

namespace smolink {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<LinkStore> store,
                         std::shared_ptr<Authorizer> authorizer, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), store_(std::move(store)), authorizer_(std::move(authorizer)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    observability_->Debug("요청 읽기 실패", {{"error", ec.message()}});
    return;
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "smolink");

  auto target = SplitTarget(std::string(req_.target()));
  if (target.path == "/c") {
    HandleCreate(target.query, *res);
  } else {
    HandleExpand(target.path, *res);
  }
  SendResponse(res);
}

void HttpSession::HandleCreate(const std::string& query, Response& res) {
  using namespace boost::beast;
  std::optional<std::string> auth_header;
  auto auth_it = req_.find(http::field::authorization);
  if (auth_it != req_.end()) {
    auth_header = std::string(auth_it->value());
  }
  if (!authorizer_->Authorize(auth_header)) {
    return SetTextBody(res, http::status::unauthorized, kUnauthorized);
  }

  if (req_.method() != http::verb::post && req_.method() != http::verb::get) {
    return SetTextBody(res, http::status::method_not_allowed, kMethodNotSupported);
  }

  auto params = ParseQueryParams(query);
  auto it = params.find("url");
  std::string original_url = it == params.end() ? std::string() : it->second;
  observability_->Debug("단축 요청 URL", {{"traceId", trace_id_}, {"url", original_url}});
  if (!IsAbsoluteUri(original_url)) {
    observability_->Info("잘못된 URL", {{"traceId", trace_id_}, {"url", original_url}});
    return SetTextBody(res, http::status::bad_request, kMalformedUrl);
  }

  try {
    auto short_url = store_->Insert(original_url);
    auto body = MakeShortUrlBody(short_url.url).dump();
    res.result(http::status::ok);
    res.set(http::field::content_type, "application/json");
    res.body() = body;
    res.content_length(body.size());
  } catch (const DbException& ex) {
    observability_->Error("단축 URL 생성 실패", {{"traceId", trace_id_}, {"error", ex.what()}, {"code", ex.code}});
    SetTextBody(res, http::status::internal_server_error, kCreateFailed);
  } catch (const std::exception& ex) {
    observability_->Error("단축 URL 생성 실패", {{"traceId", trace_id_}, {"error", ex.what()}});
    SetTextBody(res, http::status::internal_server_error, kCreateFailed);
  }
}

void HttpSession::HandleExpand(const std::string& path, Response& res) {
  using namespace boost::beast;
  if (req_.method() != http::verb::get) {
    return SetTextBody(res, http::status::method_not_allowed, kMethodNotSupported);
  }

  std::optional<std::string> full_url;
  try {
    full_url = store_->Lookup(path);
  } catch (const DbException& ex) {
    observability_->Error("원본 URL 조회 실패", {{"traceId", trace_id_}, {"error", ex.what()}, {"code", ex.code}});
    return SetTextBody(res, http::status::internal_server_error, kExpandFailed);
  } catch (const std::exception& ex) {
    observability_->Error("원본 URL 조회 실패", {{"traceId", trace_id_}, {"error", ex.what()}});
    return SetTextBody(res, http::status::internal_server_error, kExpandFailed);
  }
  if (!full_url) {
    // 없는 토큰도 500으로 응답한다. 기존 클라이언트가 이 동작에 의존한다.
    observability_->Info("원본 URL을 찾지 못했습니다", {{"traceId", trace_id_}, {"path", path}});
    return SetTextBody(res, http::status::internal_server_error, kExpandFailed);
  }

  res.result(http::status::temporary_redirect);
  res.set(http::field::location, *full_url);
  res.content_length(0);
}

void HttpSession::SetTextBody(Response& res, boost::beast::http::status status, std::string_view message) {
  res.result(status);
  res.set(boost::beast::http::field::content_type, "text/plain; charset=utf-8");
  res.body() = std::string(message);
  res.content_length(res.body().size());
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogContext{trace_id_, std::string(req_.method_string()), std::string(req_.target()),
                                 res->result_int(), latency});
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

}  // namespace smolink
