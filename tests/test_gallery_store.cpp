#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <memory>

#include "services/FileGalleryStore.hpp"
#include "SyntheticData.hpp"

namespace {
// 디렉토리 커밋 단계에서만 실패
class CommitFailingStore : public FileGalleryStore {
public:
	using FileGalleryStore::FileGalleryStore;

protected:
	bool commitDirectory(const QVector<Subject>&) override { return false; }
};

// 커밋 직전에 다른 인스턴스가 같은 디렉토리에 put 을 시도
class InterleavingStore : public FileGalleryStore {
public:
	InterleavingStore(const QString& root, FileGalleryStore& other, const Subject& otherSubject, const FingerTemplate& otherTpl)
		: FileGalleryStore(root), other_(other), otherSubject_(otherSubject), otherTpl_(otherTpl) {}

	FpStatus interleavedStatus = FpStatus::Ok;

protected:
	bool commitDirectory(const QVector<Subject>& subjects) override
	{
		interleavedStatus = other_.put(otherSubject_, otherTpl_);
		return FileGalleryStore::commitDirectory(subjects);
	}

private:
	FileGalleryStore& other_;
	Subject otherSubject_;
	FingerTemplate otherTpl_;
};

void writeRaw(const QString& path, const QByteArray& body)
{
	QFile f(path);
	ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
	f.write(body);
}

class FileGalleryStoreTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		ASSERT_TRUE(tmp.isValid());
		root = tmp.filePath("gallery");
		store = std::make_unique<FileGalleryStore>(root);
		ASSERT_TRUE(store->init());
	}

	QTemporaryDir tmp;
	QString root;
	std::unique_ptr<FileGalleryStore> store;
};
} // namespace

TEST_F(FileGalleryStoreTest, EmptyStoreListsNothing)
{
	QVector<Subject> subjects;
	EXPECT_EQ(store->listSubjects(subjects), FpStatus::Ok);
	EXPECT_TRUE(subjects.isEmpty());

	FpStatus st = FpStatus::IoFailure;
	EXPECT_FALSE(store->exists(1, &st));
	EXPECT_EQ(st, FpStatus::Ok);

	FingerTemplate t;
	EXPECT_EQ(store->getTemplate(1, t), FpStatus::NotFound);
}

TEST_F(FileGalleryStoreTest, FloatTemplateRoundTripsExactly)
{
	DescriptorSet set = synth::randomFloatSet(25, 128, 42);
	FingerTemplate in = synth::templateFrom(set);
	in.captures = 3;
	ASSERT_EQ(store->put(Subject{ 1, "Alice" }, in), FpStatus::Ok);

	FingerTemplate out;
	ASSERT_EQ(store->getTemplate(1, out), FpStatus::Ok);
	EXPECT_EQ(out.strategy, DetectorStrategy::Primary);
	EXPECT_EQ(out.captures, 3);
	EXPECT_EQ(out.primary.descriptors.type(), CV_32F);
	EXPECT_EQ(synth::maxAbsDiff(out.primary.descriptors, in.primary.descriptors), 0.0);
	EXPECT_EQ(synth::maxAbsDiff(out.centroid, in.centroid), 0.0);

	ASSERT_EQ(out.primary.keypoints.size(), in.primary.keypoints.size());
	for (size_t i = 0; i < in.primary.keypoints.size(); ++i) {
		EXPECT_EQ(out.primary.keypoints[i].pt, in.primary.keypoints[i].pt);
		EXPECT_FLOAT_EQ(out.primary.keypoints[i].angle, in.primary.keypoints[i].angle);
	}
}

TEST_F(FileGalleryStoreTest, BinaryTemplateRoundTripsExactly)
{
	const FingerTemplate in = synth::templateFrom(synth::randomBinarySet(40, 3));
	ASSERT_EQ(store->put(Subject{ 2, "Bob" }, in), FpStatus::Ok);

	FingerTemplate out;
	ASSERT_EQ(store->getTemplate(2, out), FpStatus::Ok);
	EXPECT_EQ(out.strategy, DetectorStrategy::Fallback);
	EXPECT_EQ(out.primary.descriptors.type(), CV_8U);
	EXPECT_EQ(synth::maxAbsDiff(out.primary.descriptors, in.primary.descriptors), 0.0);
}

TEST_F(FileGalleryStoreTest, ListingKeepsEnrollmentOrder)
{
	for (int id : { 5, 2, 9 }) {
		ASSERT_EQ(store->put(Subject{ id, QStringLiteral("S%1").arg(id) },
							 synth::templateFrom(synth::randomFloatSet(10, 16, id))), FpStatus::Ok);
	}

	QVector<Subject> subjects;
	ASSERT_EQ(store->listSubjects(subjects), FpStatus::Ok);
	ASSERT_EQ(subjects.size(), 3);
	EXPECT_EQ(subjects[0].id, 5);
	EXPECT_EQ(subjects[1].id, 2);
	EXPECT_EQ(subjects[2].id, 9);
	EXPECT_EQ(subjects[2].name, QStringLiteral("S9"));

	// 새 인스턴스에서도 동일
	FileGalleryStore reopened(root);
	QVector<Subject> again;
	ASSERT_EQ(reopened.listSubjects(again), FpStatus::Ok);
	EXPECT_EQ(again.size(), 3);
	EXPECT_TRUE(reopened.exists(2));
}

TEST_F(FileGalleryStoreTest, DuplicateIdKeepsFirstEnrollment)
{
	const FingerTemplate first  = synth::templateFrom(synth::randomFloatSet(10, 16, 1));
	const FingerTemplate second = synth::templateFrom(synth::randomFloatSet(12, 16, 2));
	ASSERT_EQ(store->put(Subject{ 7, "Carol" }, first), FpStatus::Ok);
	EXPECT_EQ(store->put(Subject{ 7, "Mallory" }, second), FpStatus::DuplicateId);

	QVector<Subject> subjects;
	ASSERT_EQ(store->listSubjects(subjects), FpStatus::Ok);
	ASSERT_EQ(subjects.size(), 1);
	EXPECT_EQ(subjects[0].name, QStringLiteral("Carol"));

	FingerTemplate out;
	ASSERT_EQ(store->getTemplate(7, out), FpStatus::Ok);
	EXPECT_EQ(synth::maxAbsDiff(out.primary.descriptors, first.primary.descriptors), 0.0);
}

TEST_F(FileGalleryStoreTest, RejectsInvalidEnrollment)
{
	const FingerTemplate t = synth::templateFrom(synth::randomFloatSet(10, 16, 1));
	EXPECT_EQ(store->put(Subject{ 0, "Zero" }, t), FpStatus::InvalidInput);
	EXPECT_EQ(store->put(Subject{ -3, "Neg" }, t), FpStatus::InvalidInput);
	EXPECT_EQ(store->put(Subject{ 4, "  " }, t), FpStatus::InvalidInput);
	EXPECT_EQ(store->put(Subject{ 4, "Empty" }, FingerTemplate{}), FpStatus::InvalidInput);

	QVector<Subject> subjects;
	ASSERT_EQ(store->listSubjects(subjects), FpStatus::Ok);
	EXPECT_TRUE(subjects.isEmpty());
}

TEST_F(FileGalleryStoreTest, FailedCommitLeavesNoTrace)
{
	CommitFailingStore failing(root);
	ASSERT_TRUE(failing.init());

	const FingerTemplate t = synth::templateFrom(synth::randomFloatSet(10, 16, 1));
	EXPECT_EQ(failing.put(Subject{ 3, "Dave" }, t), FpStatus::IoFailure);

	FingerTemplate out;
	EXPECT_EQ(store->getTemplate(3, out), FpStatus::NotFound);
	EXPECT_FALSE(store->exists(3));
	QVector<Subject> subjects;
	ASSERT_EQ(store->listSubjects(subjects), FpStatus::Ok);
	EXPECT_TRUE(subjects.isEmpty());
	EXPECT_FALSE(QFile::exists(store->templatePath(3)));
	EXPECT_FALSE(QFile::exists(store->templatePath(3) + ".tmp"));

	// 같은 id 로 다시 등록 가능
	EXPECT_EQ(store->put(Subject{ 3, "Dave" }, t), FpStatus::Ok);
}

TEST_F(FileGalleryStoreTest, OrphanTemplateIsInvisibleAndReplaced)
{
	// 디렉토리 커밋 전에 중단된 상황 재현
	const FingerTemplate stale = synth::templateFrom(synth::randomFloatSet(10, 16, 1));
	ASSERT_EQ(store->put(Subject{ 1, "Tmp" }, stale), FpStatus::Ok);
	ASSERT_TRUE(QFile::copy(store->templatePath(1), store->templatePath(8)));

	FingerTemplate out;
	EXPECT_EQ(store->getTemplate(8, out), FpStatus::NotFound);
	EXPECT_FALSE(store->exists(8));

	const FingerTemplate fresh = synth::templateFrom(synth::randomBinarySet(20, 2));
	ASSERT_EQ(store->put(Subject{ 8, "Erin" }, fresh), FpStatus::Ok);
	ASSERT_EQ(store->getTemplate(8, out), FpStatus::Ok);
	EXPECT_EQ(out.strategy, DetectorStrategy::Fallback);
	EXPECT_EQ(synth::maxAbsDiff(out.primary.descriptors, fresh.primary.descriptors), 0.0);
}

TEST_F(FileGalleryStoreTest, UnparsableDirectoryIsStoreCorrupt)
{
	writeRaw(store->directoryPath(), "{ \"items\": [ {\"id\": ");

	QVector<Subject> subjects;
	EXPECT_EQ(store->listSubjects(subjects), FpStatus::StoreCorrupt);

	FpStatus st = FpStatus::Ok;
	EXPECT_FALSE(store->exists(1, &st));
	EXPECT_EQ(st, FpStatus::StoreCorrupt);

	const FingerTemplate t = synth::templateFrom(synth::randomFloatSet(10, 16, 1));
	EXPECT_EQ(store->put(Subject{ 1, "Alice" }, t), FpStatus::StoreCorrupt);
}

TEST_F(FileGalleryStoreTest, DuplicatedIdsInDirectoryAreStoreCorrupt)
{
	writeRaw(store->directoryPath(),
			 R"({"version":1,"count":2,"items":[{"id":4,"name":"A"},{"id":4,"name":"B"}]})");
	QVector<Subject> subjects;
	EXPECT_EQ(store->listSubjects(subjects), FpStatus::StoreCorrupt);
}

TEST_F(FileGalleryStoreTest, ListedSubjectWithoutTemplateIsStoreCorrupt)
{
	ASSERT_EQ(store->put(Subject{ 6, "Frank" }, synth::templateFrom(synth::randomFloatSet(10, 16, 1))), FpStatus::Ok);
	ASSERT_TRUE(QFile::remove(store->templatePath(6)));

	FingerTemplate out;
	EXPECT_EQ(store->getTemplate(6, out), FpStatus::StoreCorrupt);

	writeRaw(store->templatePath(6), "%YAML:1.0\n---\ndetector: \"surf\"\n");
	EXPECT_EQ(store->getTemplate(6, out), FpStatus::StoreCorrupt);
}

TEST(MemoryGalleryStoreTest, BehavesLikeTheFileStore)
{
	MemoryGalleryStore store;
	const FingerTemplate t = synth::templateFrom(synth::randomFloatSet(10, 16, 1));

	EXPECT_EQ(store.put(Subject{ 1, "Alice" }, t), FpStatus::Ok);
	EXPECT_EQ(store.put(Subject{ 1, "Again" }, t), FpStatus::DuplicateId);
	EXPECT_EQ(store.put(Subject{ 0, "Zero" }, t), FpStatus::InvalidInput);
	EXPECT_TRUE(store.exists(1));

	FingerTemplate out;
	EXPECT_EQ(store.getTemplate(2, out), FpStatus::NotFound);
	ASSERT_EQ(store.getTemplate(1, out), FpStatus::Ok);
	EXPECT_EQ(synth::maxAbsDiff(out.primary.descriptors, t.primary.descriptors), 0.0);
}

TEST_F(FileGalleryStoreTest, OverlappingPutsNeverLoseAnAcceptedSubject)
{
	const FingerTemplate t1 = synth::templateFrom(synth::randomFloatSet(10, 16, 1));
	const FingerTemplate t2 = synth::templateFrom(synth::randomFloatSet(10, 16, 2));

	FileGalleryStore second(root);
	second.setLockTimeout(50);
	InterleavingStore first(root, second, Subject{ 2, "Bob" }, t2);

	ASSERT_EQ(first.put(Subject{ 1, "Alice" }, t1), FpStatus::Ok);
	// 잠금 중에는 Ok 로 끝나지 않는다
	EXPECT_EQ(first.interleavedStatus, FpStatus::IoFailure);

	QVector<Subject> subjects;
	ASSERT_EQ(store->listSubjects(subjects), FpStatus::Ok);
	ASSERT_EQ(subjects.size(), 1);
	EXPECT_EQ(subjects[0].id, 1);

	// 잠금이 풀린 뒤 다시 시도하면 둘 다 남는다
	ASSERT_EQ(second.put(Subject{ 2, "Bob" }, t2), FpStatus::Ok);
	ASSERT_EQ(store->listSubjects(subjects), FpStatus::Ok);
	ASSERT_EQ(subjects.size(), 2);
	EXPECT_EQ(subjects[0].id, 1);
	EXPECT_EQ(subjects[1].id, 2);
	EXPECT_FALSE(QFile::exists(store->lockPath()));
}
