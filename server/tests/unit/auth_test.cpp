#include <memory>

#include <gtest/gtest.h>

#include "smolink/auth.hpp"
#include "support/in_memory_link_store.hpp"

using smolink::ExtractBearerToken;

TEST(BearerTokenTest, ExtractsTokenAfterPrefix) {
  EXPECT_EQ(ExtractBearerToken("Bearer abc").value(), "abc");
  EXPECT_EQ(ExtractBearerToken("Bearer a b").value(), "a b");
}

TEST(BearerTokenTest, UsesFirstOccurrenceOfPrefix) {
  EXPECT_EQ(ExtractBearerToken("xBearer abc").value(), "abc");
  EXPECT_EQ(ExtractBearerToken("Bearer Bearer abc").value(), "Bearer abc");
}

TEST(BearerTokenTest, RejectsMissingPrefixOrEmptyToken) {
  EXPECT_FALSE(ExtractBearerToken("").has_value());
  EXPECT_FALSE(ExtractBearerToken("Bearer ").has_value());
  EXPECT_FALSE(ExtractBearerToken("Bearer").has_value());
  EXPECT_FALSE(ExtractBearerToken("bearer abc").has_value());
  EXPECT_FALSE(ExtractBearerToken("Basic abc").has_value());
}

class AuthorizerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<smolink::test_support::InMemoryLinkStore>("https://short.example");
    token_ = store_->ProvisionDefaultToken().value();
    authorizer_ = std::make_unique<smolink::Authorizer>(store_);
  }

  std::shared_ptr<smolink::test_support::InMemoryLinkStore> store_;
  std::unique_ptr<smolink::Authorizer> authorizer_;
  std::string token_;
};

TEST_F(AuthorizerTest, AcceptsStoredToken) {
  EXPECT_TRUE(authorizer_->Authorize("Bearer " + token_));
  EXPECT_EQ(store_->ValidateCalls(), 1);
}

TEST_F(AuthorizerTest, RejectsWrongToken) {
  EXPECT_FALSE(authorizer_->Authorize(std::string("Bearer not-the-token")));
  EXPECT_FALSE(authorizer_->Authorize("Bearer " + token_ + "x"));
}

TEST_F(AuthorizerTest, RejectsWithoutConsultingStoreWhenHeaderUnusable) {
  EXPECT_FALSE(authorizer_->Authorize(std::nullopt));
  EXPECT_FALSE(authorizer_->Authorize(std::string()));
  EXPECT_FALSE(authorizer_->Authorize("Token " + token_));
  EXPECT_EQ(store_->ValidateCalls(), 0);
}
