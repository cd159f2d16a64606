/*
 * 설명: 단축 링크와 인증 토큰을 MariaDB에 저장하고 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_link_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "smolink/db_client.hpp"
#include "smolink/link_store.hpp"
#include "smolink/observability.hpp"

namespace smolink {

class MariaDbLinkStore : public LinkStore {
 public:
  MariaDbLinkStore(std::shared_ptr<MariaDbClient> db_client, std::string base_url,
                   std::shared_ptr<Observability> observability);

  void EnsureSchema() override;
  ShortUrl Insert(const std::string& original_url) override;
  std::optional<std::string> Lookup(const std::string& short_path) override;
  bool ValidateToken(const std::string& token) override;
  std::optional<std::string> ProvisionDefaultToken() override;

  void ClearAll() const;

 private:
  std::optional<std::string> FetchSingleValue(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  std::shared_ptr<MariaDbClient> db_client_;
  std::string base_url_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace smolink
