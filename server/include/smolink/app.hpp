/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/link_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "smolink/auth.hpp"
#include "smolink/config.hpp"
#include "smolink/db_client.hpp"
#include "smolink/link_store.hpp"
#include "smolink/observability.hpp"

namespace smolink {

class Listener;

class ServerApp {
 public:
  // 설정의 DB 정보로 MariaDbLinkStore를 만든다.
  explicit ServerApp(const AppConfig& config);
  ServerApp(const AppConfig& config, std::shared_ptr<LinkStore> store, std::shared_ptr<Observability> observability);
  ~ServerApp();

  // 스키마 생성과 기본 토큰 발급. 토큰 발급이 실패하면 false.
  bool Bootstrap();
  // SIGINT/SIGTERM 또는 Stop() 호출까지 블록한다. 리스너 생성에 실패하면 false.
  bool Run();
  void Stop();

 private:
  void RunWorkers();
  void JoinWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<LinkStore> store_;
  std::shared_ptr<Authorizer> authorizer_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace smolink
