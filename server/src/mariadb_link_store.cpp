/*
 * 설명: links/authorization 테이블에 대한 생성, 조회, 토큰 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_link_store_it_test.cpp
 */
#include "smolink/mariadb_link_store.hpp"

#include <sstream>
#include <utility>

#include "smolink/token_generator.hpp"
#include "smolink/uri.hpp"

namespace smolink {
namespace {
constexpr const char* kCreateAuthorizationTable =
    "CREATE TABLE IF NOT EXISTS `authorization` ("
    "id BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY, "
    "token VARCHAR(64) CHARACTER SET ascii COLLATE ascii_bin NOT NULL, "
    "date_created DATETIME(6) NOT NULL)";

constexpr const char* kCreateLinksTable =
    "CREATE TABLE IF NOT EXISTS links ("
    "short_url VARCHAR(64) CHARACTER SET ascii COLLATE ascii_bin NOT NULL PRIMARY KEY, "
    "full_url TEXT NOT NULL, "
    "date_created DATETIME(6) NOT NULL)";

std::string MaskToken(const std::string& token) {
  if (token.size() <= 4) {
    return "****";
  }
  return token.substr(0, 4) + "****";
}
}  // namespace

MariaDbLinkStore::MariaDbLinkStore(std::shared_ptr<MariaDbClient> db_client, std::string base_url,
                                   std::shared_ptr<Observability> observability)
    : db_client_(std::move(db_client)), base_url_(std::move(base_url)), observability_(std::move(observability)) {}

void MariaDbLinkStore::EnsureSchema() {
  for (const char* ddl : {kCreateAuthorizationTable, kCreateLinksTable}) {
    try {
      db_client_->WithConnection([&](MYSQL* conn) {
        if (mysql_query(conn, ddl) != 0) {
          db_client_->RaiseError(conn, "테이블 생성 실패");
        }
      });
    } catch (const DbException& ex) {
      // 스키마가 없어도 프로세스는 계속 실행된다.
      observability_->Error("스키마 생성 실패", {{"error", ex.what()}, {"code", ex.code}});
    }
  }
}

ShortUrl MariaDbLinkStore::Insert(const std::string& original_url) {
  ShortUrl short_url{GenerateShortToken(), {}};
  short_url.url = MakeShortUrl(base_url_, short_url.token);
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO links(short_url, full_url, date_created) VALUES('" << db_client_->Escape(conn, short_url.token)
        << "', '" << db_client_->Escape(conn, original_url) << "', NOW(6));";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "링크 저장 실패");
    }
  });
  return short_url;
}

std::optional<std::string> MariaDbLinkStore::Lookup(const std::string& short_path) {
  auto token = ExtractShortToken(short_path);
  if (!token) {
    observability_->Debug("단축 경로 파싱 실패", {{"path", short_path}});
    return std::nullopt;
  }
  std::optional<std::string> full_url;
  db_client_->WithConnection([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT full_url FROM links WHERE short_url='" << db_client_->Escape(conn, *token) << "';";
    full_url = FetchSingleValue(conn, oss.str(), "링크 조회 실패");
  });
  return full_url;
}

bool MariaDbLinkStore::ValidateToken(const std::string& token) {
  std::optional<std::string> stored;
  try {
    db_client_->WithConnection([&](MYSQL* conn) {
      std::ostringstream oss;
      oss << "SELECT token FROM `authorization` WHERE token='" << db_client_->Escape(conn, token) << "' LIMIT 1;";
      stored = FetchSingleValue(conn, oss.str(), "인증 토큰 조회 실패");
    });
  } catch (const DbException& ex) {
    observability_->Error("인증 토큰 조회 실패", {{"token", MaskToken(token)}, {"error", ex.what()}});
    return false;
  }
  if (!stored) {
    observability_->Info("일치하는 인증 토큰이 없습니다", {{"token", MaskToken(token)}});
    return false;
  }
  return *stored == token;
}

std::optional<std::string> MariaDbLinkStore::ProvisionDefaultToken() {
  std::optional<std::string> created;
  db_client_->WithConnection([&](MYSQL* conn) {
    auto existing = FetchSingleValue(conn, "SELECT token FROM `authorization` LIMIT 1;", "인증 토큰 확인 실패");
    if (existing) {
      return;
    }
    auto token = GenerateAuthorizationToken();
    std::ostringstream oss;
    oss << "INSERT INTO `authorization`(token, date_created) VALUES('" << db_client_->Escape(conn, token)
        << "', NOW(6));";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "기본 인증 토큰 저장 실패");
    }
    created = token;
  });
  return created;
}

void MariaDbLinkStore::ClearAll() const {
  db_client_->WithConnection([&](MYSQL* conn) {
    if (mysql_query(conn, "DELETE FROM links;") != 0) {
      db_client_->RaiseError(conn, "링크 삭제 실패");
    }
    if (mysql_query(conn, "DELETE FROM `authorization`;") != 0) {
      db_client_->RaiseError(conn, "인증 토큰 삭제 실패");
    }
  });
}

std::optional<std::string> MariaDbLinkStore::FetchSingleValue(MYSQL* conn, const std::string& sql,
                                                              const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    db_client_->RaiseError(conn, ctx);
  }
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    db_client_->RaiseError(conn, ctx + " (결과 없음)");
  }
  std::optional<std::string> value;
  MYSQL_ROW row = mysql_fetch_row(res);
  if (row && row[0]) {
    unsigned long* lengths = mysql_fetch_lengths(res);
    value = std::string(row[0], lengths ? lengths[0] : std::char_traits<char>::length(row[0]));
  }
  mysql_free_result(res);
  return value;
}

}  // namespace smolink
