#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "faq_core/services/answer_composer.hpp"
#include "../../common/mocks_test.hpp"

namespace faq_core {

using ::testing::_;
using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Not;
using ::testing::Return;
using ::testing::Throw;

class AnswerComposerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    mock_completion_ = std::make_shared<faq_tests::MockCompletionProvider>();
    composer_ = std::make_unique<AnswerComposer>(mock_completion_);
  }

  std::vector<ScoredEntry> ranked_with_top_score(double score) {
    return {ScoredEntry{CorpusEntry{"How do I reset my password?",
                                    "Use the reset link on the login page."},
                        score, 0},
            ScoredEntry{CorpusEntry{"Where is the office?", "On the third floor."}, score / 2, 1}};
  }

  std::shared_ptr<faq_tests::MockCompletionProvider> mock_completion_;
  std::unique_ptr<AnswerComposer> composer_;
  CancellationToken cancel_;
};

TEST_F(AnswerComposerTest, Compose_EmptyRankingReturnsNoMatch) {
  EXPECT_CALL(*mock_completion_, complete(_, _)).Times(0);

  AnswerResult result = composer_->compose("anything", {}, cancel_);

  EXPECT_EQ(result.status, AnswerStatus::NoConfidentMatch);
  EXPECT_FALSE(result.matched_question.has_value());
  EXPECT_EQ(result.score, 0.0);
  EXPECT_EQ(result.text, composer_->options().no_match_message);
}

TEST_F(AnswerComposerTest, Compose_BelowThresholdReturnsNoMatchWithTopScore) {
  EXPECT_CALL(*mock_completion_, complete(_, _)).Times(0);

  AnswerResult result = composer_->compose("anything", ranked_with_top_score(0.49), cancel_);

  EXPECT_EQ(result.status, AnswerStatus::NoConfidentMatch);
  EXPECT_FALSE(result.matched_question.has_value());
  EXPECT_DOUBLE_EQ(result.score, 0.49);
  EXPECT_THAT(result.text, HasSubstr("could not find a close match"));
}

TEST_F(AnswerComposerTest, Compose_ThresholdIsInclusive) {
  EXPECT_CALL(*mock_completion_, complete(_, _)).WillOnce(Return("Generated."));

  AnswerResult result = composer_->compose("reset?", ranked_with_top_score(0.5), cancel_);

  EXPECT_EQ(result.status, AnswerStatus::Answered);
}

TEST_F(AnswerComposerTest, Compose_ConfidentMatchGroundsPromptOnTopAnswer) {
  std::string captured_prompt;
  EXPECT_CALL(*mock_completion_, complete(_, _))
      .WillOnce(Invoke([&](const std::string& prompt, const CancellationToken&) {
        captured_prompt = prompt;
        return std::string("Click the reset link on the login page and follow the email.");
      }));

  AnswerResult result =
      composer_->compose("I forgot my password", ranked_with_top_score(0.9), cancel_);

  EXPECT_EQ(result.status, AnswerStatus::Answered);
  EXPECT_EQ(result.text, "Click the reset link on the login page and follow the email.");
  ASSERT_TRUE(result.matched_question.has_value());
  EXPECT_EQ(*result.matched_question, "How do I reset my password?");
  EXPECT_DOUBLE_EQ(result.score, 0.9);
  EXPECT_THAT(captured_prompt, AllOf(HasSubstr("I forgot my password"),
                                     HasSubstr("Use the reset link on the login page."),
                                     HasSubstr("trusted ground truth"),
                                     HasSubstr("2-3"),
                                     HasSubstr("unsure"),
                                     Not(HasSubstr("On the third floor."))));
}

TEST_F(AnswerComposerTest, Compose_CompletionFailureKeepsRetrievalMetadata) {
  EXPECT_CALL(*mock_completion_, complete(_, _))
      .WillOnce(Throw(CompletionUnavailableError("connection refused")));

  AnswerResult result = composer_->compose("reset?", ranked_with_top_score(0.9), cancel_);

  EXPECT_EQ(result.status, AnswerStatus::CompletionUnavailable);
  ASSERT_TRUE(result.matched_question.has_value());
  EXPECT_EQ(*result.matched_question, "How do I reset my password?");
  EXPECT_DOUBLE_EQ(result.score, 0.9);
  EXPECT_THAT(result.text, HasSubstr("could not reach the AI writer"));
  EXPECT_THAT(result.text, HasSubstr("connection refused"));
  EXPECT_THAT(result.text, Not(HasSubstr("Use the reset link on the login page.")));
}

TEST_F(AnswerComposerTest, Compose_CancelledBeforeCompletionSkipsProvider) {
  EXPECT_CALL(*mock_completion_, complete(_, _)).Times(0);
  cancel_.cancel();

  AnswerResult result = composer_->compose("reset?", ranked_with_top_score(0.9), cancel_);

  EXPECT_EQ(result.status, AnswerStatus::Cancelled);
  ASSERT_TRUE(result.matched_question.has_value());
  EXPECT_DOUBLE_EQ(result.score, 0.9);
}

TEST_F(AnswerComposerTest, Compose_CancelledDuringCompletion) {
  EXPECT_CALL(*mock_completion_, complete(_, _)).WillOnce(Throw(CompletionCancelledError()));

  AnswerResult result = composer_->compose("reset?", ranked_with_top_score(0.9), cancel_);

  EXPECT_EQ(result.status, AnswerStatus::Cancelled);
}

TEST_F(AnswerComposerTest, Compose_CustomThreshold) {
  ComposerOptions options;
  options.confidence_threshold = 0.95;
  AnswerComposer strict(mock_completion_, options);
  EXPECT_CALL(*mock_completion_, complete(_, _)).Times(0);

  AnswerResult result = strict.compose("reset?", ranked_with_top_score(0.9), cancel_);

  EXPECT_EQ(result.status, AnswerStatus::NoConfidentMatch);
  EXPECT_DOUBLE_EQ(result.score, 0.9);
}

TEST(AnswerComposerConstructionTest, NullProviderThrows) {
  EXPECT_THROW({ AnswerComposer composer(nullptr); }, std::invalid_argument);
}

}  // namespace faq_core
