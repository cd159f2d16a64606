/*
 * 설명: HTTP 연결을 처리하고 단축 링크 생성/확장 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/link_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "smolink/auth.hpp"
#include "smolink/link_store.hpp"
#include "smolink/observability.hpp"

namespace smolink {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<LinkStore> store,
              std::shared_ptr<Authorizer> authorizer, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleCreate(const std::string& query, Response& res);
  void HandleExpand(const std::string& path, Response& res);
  void SetTextBody(Response& res, boost::beast::http::status status, std::string_view message);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<LinkStore> store_;
  std::shared_ptr<Authorizer> authorizer_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace smolink
