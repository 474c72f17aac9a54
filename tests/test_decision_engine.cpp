#include <gtest/gtest.h>

#include "match/DecisionEngine.hpp"
#include "services/GalleryStore.hpp"
#include "SyntheticData.hpp"

namespace {
// 목록은 정상인데 템플릿을 못 읽는 저장소
class BrokenTemplateStore : public GalleryStore {
public:
	explicit BrokenTemplateStore(FpStatus templateStatus) : templateStatus_(templateStatus) {}

	FpStatus put(const Subject&, const FingerTemplate&) override { return FpStatus::IoFailure; }
	FpStatus getTemplate(int, FingerTemplate&) const override { return templateStatus_; }
	FpStatus listSubjects(QVector<Subject>& out) const override
	{
		out = { Subject{ 3, QStringLiteral("Ghost") } };
		return FpStatus::Ok;
	}
	bool exists(int id, FpStatus* status) const override
	{
		if (status) *status = FpStatus::Ok;
		return id == 3;
	}

private:
	FpStatus templateStatus_;
};

class UnreadableStore : public BrokenTemplateStore {
public:
	UnreadableStore() : BrokenTemplateStore(FpStatus::Ok) {}
	FpStatus listSubjects(QVector<Subject>&) const override { return FpStatus::StoreCorrupt; }
};

class DecisionEngineTest : public ::testing::Test {
protected:
	FingerMatcher matcher;
	MemoryGalleryStore gallery;
	// 40 x 64 basis query, 후보는 앞쪽 k 행을 공유
	DescriptorSet query = synth::basisSet(40, 0, 64);

	void enroll(int id, const QString& name, const DescriptorSet& set)
	{
		ASSERT_EQ(gallery.put(Subject{ id, name }, synth::templateFrom(set)), FpStatus::Ok);
	}
};
} // namespace

TEST_F(DecisionEngineTest, ThresholdBoundaryIsInclusive)
{
	enroll(1, "Alice", synth::basisSet(20, 0, 64));
	const DecisionEngine engine(matcher);

	Verdict v = engine.decide(query, gallery, 20);
	EXPECT_EQ(v.status, FpStatus::Ok);
	EXPECT_EQ(v.best.score, 20);
	EXPECT_EQ(v.decision, Decision::Accept);

	v = engine.decide(query, gallery, 21);
	EXPECT_EQ(v.best.score, 20);
	EXPECT_EQ(v.decision, Decision::Reject);
	EXPECT_EQ(v.best.id, 1);
}

TEST_F(DecisionEngineTest, OneBelowThresholdRejects)
{
	enroll(1, "Alice", synth::basisSet(19, 0, 64));
	const Verdict v = DecisionEngine(matcher).decide(query, gallery, 20);
	EXPECT_EQ(v.best.score, 19);
	EXPECT_EQ(v.decision, Decision::Reject);
}

TEST_F(DecisionEngineTest, BestCandidateWinsAndTiesKeepFirstSeen)
{
	enroll(5, "Low",    synth::basisSet(10, 0, 64));
	enroll(2, "First",  synth::basisSet(25, 0, 64));
	enroll(9, "Second", synth::basisSet(25, 0, 64));

	const Verdict v = DecisionEngine(matcher).decide(query, gallery, 20);
	EXPECT_EQ(v.candidates, 3);
	EXPECT_EQ(v.best.id, 2);
	EXPECT_EQ(v.best.name, QStringLiteral("First"));
	EXPECT_EQ(v.best.score, 25);
	EXPECT_EQ(v.decision, Decision::Accept);
}

TEST_F(DecisionEngineTest, NonPositiveThresholdUsesDetectorDefault)
{
	enroll(1, "Alice", synth::basisSet(25, 0, 64));
	const DecisionEngine engine(matcher);

	// float descriptor → SIFT 기본값 30
	Verdict v = engine.decide(query, gallery, 0);
	EXPECT_EQ(v.threshold, 30);
	EXPECT_EQ(v.decision, Decision::Reject);

	v = engine.decide(query, gallery);
	EXPECT_EQ(v.threshold, DecisionEngine::defaultThreshold(DetectorStrategy::Primary));

	DecisionParams p;
	p.acceptThreshold = 25;
	EXPECT_EQ(DecisionEngine(matcher, p).decide(query, gallery).decision, Decision::Accept);

	EXPECT_EQ(DecisionEngine::defaultThreshold(DetectorStrategy::Fallback), 20);
}

TEST_F(DecisionEngineTest, WeakQueryIsInsufficientFeatures)
{
	enroll(1, "Alice", synth::basisSet(25, 0, 64));
	DescriptorSet weak;
	weak.descriptors = cv::Mat::zeros(1, 100, CV_32F);

	const Verdict v = DecisionEngine(matcher).decide(weak, gallery, 1);
	EXPECT_EQ(v.status, FpStatus::InsufficientFeatures);
	EXPECT_EQ(v.decision, Decision::Reject);
	EXPECT_EQ(v.candidates, 0);
}

TEST_F(DecisionEngineTest, EmptyGalleryReportsNoEnrolledSubjects)
{
	const Verdict v = DecisionEngine(matcher).decide(query, gallery, 20);
	EXPECT_EQ(v.status, FpStatus::NoEnrolledSubjects);
	EXPECT_EQ(v.decision, Decision::Reject);
}

TEST_F(DecisionEngineTest, OtherDetectorTemplatesScoreZero)
{
	enroll(4, "Orb", synth::randomBinarySet(40, 1));
	const Verdict v = DecisionEngine(matcher).decide(query, gallery, 1);
	EXPECT_EQ(v.status, FpStatus::Ok);
	EXPECT_EQ(v.candidates, 1);
	EXPECT_EQ(v.best.id, 4);
	EXPECT_EQ(v.best.score, 0);
	EXPECT_EQ(v.decision, Decision::Reject);
}

TEST_F(DecisionEngineTest, ListedButUnreadableTemplateIsStoreCorrupt)
{
	const DecisionEngine engine(matcher);

	Verdict v = engine.decide(query, BrokenTemplateStore(FpStatus::NotFound), 20);
	EXPECT_EQ(v.status, FpStatus::StoreCorrupt);
	EXPECT_EQ(v.decision, Decision::Reject);

	v = engine.decide(query, BrokenTemplateStore(FpStatus::StoreCorrupt), 20);
	EXPECT_EQ(v.status, FpStatus::StoreCorrupt);

	v = engine.decide(query, UnreadableStore(), 20);
	EXPECT_EQ(v.status, FpStatus::StoreCorrupt);
}

TEST(DecisionScoreTest, AcceptsAtOrAboveThreshold)
{
	const FingerMatcher m;
	const DecisionEngine e(m);
	EXPECT_EQ(e.decideScore(20, 20), Decision::Accept);
	EXPECT_EQ(e.decideScore(19, 20), Decision::Reject);
	EXPECT_EQ(e.decideScore(0, 1), Decision::Reject);
}
