#include <memory>

#include <gtest/gtest.h>

#include "smolink/mariadb_link_store.hpp"

namespace {

// 포트 1에는 MariaDB가 없으므로 연결은 즉시 거부된다.
class UnreachableLinkStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    smolink::DbConfig cfg{"127.0.0.1", 1, "smolink", "smolink", "smolink"};
    store_ = std::make_unique<smolink::MariaDbLinkStore>(
        std::make_shared<smolink::MariaDbClient>(cfg), "https://short.example",
        std::make_shared<smolink::Observability>(smolink::LogLevel::kError));
  }

  std::unique_ptr<smolink::MariaDbLinkStore> store_;
};

}  // namespace

TEST_F(UnreachableLinkStoreTest, SchemaFailureIsSwallowed) { EXPECT_NO_THROW(store_->EnsureSchema()); }

TEST_F(UnreachableLinkStoreTest, TokenValidationFailsClosed) {
  EXPECT_FALSE(store_->ValidateToken("x"));
  EXPECT_FALSE(store_->ValidateToken(""));
}

TEST_F(UnreachableLinkStoreTest, LookupRaisesDbException) {
  EXPECT_THROW(store_->Lookup("/x"), smolink::DbException);
}

TEST_F(UnreachableLinkStoreTest, MalformedPathIsNotFoundWithoutConnecting) {
  EXPECT_FALSE(store_->Lookup("/%zz").has_value());
}

TEST_F(UnreachableLinkStoreTest, InsertRaisesDbException) {
  EXPECT_THROW(store_->Insert("https://example.com"), smolink::DbException);
}

TEST_F(UnreachableLinkStoreTest, ProvisionRaisesDbException) {
  EXPECT_THROW(store_->ProvisionDefaultToken(), smolink::DbException);
}
