/*
 * 설명: 서버 수명주기, 저장소 부트스트랩, 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/link_flow_test.cpp
 */
#include "smolink/app.hpp"

#include <algorithm>
#include <csignal>
#include <functional>
#include <iostream>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "smolink/http_session.hpp"
#include "smolink/mariadb_link_store.hpp"

namespace smolink {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<LinkStore> store, std::shared_ptr<Authorizer> authorizer,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), store_(std::move(store)),
        authorizer_(std::move(authorizer)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  // 대기 중인 async_accept와 같은 strand에서 닫은 뒤 on_closed를 호출한다.
  void Stop(std::function<void()> on_closed) {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this(), on_closed = std::move(on_closed)]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
      if (on_closed) {
        on_closed();
      }
    });
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->store_, self->authorizer_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<LinkStore> store_;
  std::shared_ptr<Authorizer> authorizer_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
  db_client_ = std::make_shared<MariaDbClient>(db_config);
  store_ = std::make_shared<MariaDbLinkStore>(db_client_, config.base_url, observability_);
  authorizer_ = std::make_shared<Authorizer>(store_);
}

ServerApp::ServerApp(const AppConfig& config, std::shared_ptr<LinkStore> store,
                     std::shared_ptr<Observability> observability)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)), signals_(ioc_, SIGINT, SIGTERM),
      observability_(std::move(observability)), store_(std::move(store)) {
  authorizer_ = std::make_shared<Authorizer>(store_);
}

ServerApp::~ServerApp() {
  Stop();
  JoinWorkers();
}

bool ServerApp::Bootstrap() {
  store_->EnsureSchema();
  try {
    auto key = store_->ProvisionDefaultToken();
    if (key) {
      observability_->Notice("Default authorization key: " + *key);
    }
  } catch (const DbException& ex) {
    observability_->Error("기본 인증 토큰 생성 실패", {{"error", ex.what()}, {"code", ex.code}});
    return false;
  } catch (const std::exception& ex) {
    observability_->Error("기본 인증 토큰 생성 실패", {{"error", ex.what()}});
    return false;
  }
  return true;
}

bool ServerApp::Run() {
  bool ok = true;
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, store_, authorizer_, observability_);
    listener_->Run();
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->Info("종료 신호 수신", {{"signal", signal_number}});
      Stop();
    });
    observability_->Info("Running at " + config_.base_url, {{"port", config_.port}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
    ok = false;
  }
  JoinWorkers();
  return ok;
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (!listener_) {
    ioc_.stop();
    return;
  }
  listener_->Stop([this]() { ioc_.stop(); });
}

void ServerApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

}  // namespace smolink
