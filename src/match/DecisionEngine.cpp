#include "match/DecisionEngine.hpp"

#include <QtCore/QDebug>

#include "feature/FeatureExtractor.hpp"
#include "services/GalleryStore.hpp"
#include "log/fp_logging.hpp"

int DecisionEngine::defaultThreshold(DetectorStrategy s)
{
	return s == DetectorStrategy::Primary ? recog::ACCEPT_THR_FLOAT : recog::ACCEPT_THR_BINARY;
}

Decision DecisionEngine::decideScore(int bestScore, int threshold) const
{
	return bestScore >= threshold ? Decision::Accept : Decision::Reject;
}

Verdict DecisionEngine::decide(const DescriptorSet& query, const GalleryStore& gallery) const
{
	return decide(query, gallery, p_.acceptThreshold);
}

Verdict DecisionEngine::decide(const DescriptorSet& query, const GalleryStore& gallery, int threshold) const
{
	Verdict v;
	const DetectorStrategy qs = strategyOf(query);
	v.threshold = threshold > 0 ? threshold : defaultThreshold(qs);

	if (!FeatureExtractor::isUsable(query, p_.minFeatureElements)) {
		qDebug() << "[Decision] Reject: query elements=" << query.elementCount();
		v.status = FpStatus::InsufficientFeatures;
		return v;
	}

	QVector<Subject> subjects;
	const FpStatus ls = gallery.listSubjects(subjects);
	if (ls != FpStatus::Ok) {
		v.status = ls;
		return v;
	}
	if (subjects.isEmpty()) {
		qInfo() << "[Decision] no enrolled subjects";
		v.status = FpStatus::NoEnrolledSubjects;
		return v;
	}

	// 등록 순서대로, 점수가 "더 클 때만" 교체 → 동점이면 먼저 본 쪽
	for (const Subject& s : subjects) {
		FingerTemplate t;
		const FpStatus ts = gallery.getTemplate(s.id, t);
		if (ts != FpStatus::Ok) {
			qCritical() << "[Decision] template load failed id=" << s.id << fpStatusName(ts);
			v.status = ts == FpStatus::NotFound ? FpStatus::StoreCorrupt : ts;
			v.decision = Decision::Reject;
			return v;
		}
		++v.candidates;

		int score = 0;
		if (t.strategy != qs) {
			qCDebug(LC_MATCH) << "[Decision] skip id=" << s.id << "detector"
							  << detectorStrategyName(t.strategy) << "!=" << detectorStrategyName(qs);
		}
		else {
			score = matcher_.match(query, t.primary);
		}

		if (v.best.id < 0 || score > v.best.score) {
			v.best.id    = s.id;
			v.best.name  = s.name;
			v.best.score = score;
		}
	}

	v.decision = decideScore(v.best.score, v.threshold);
	qDebug() << "[Decision]" << (v.decision == Decision::Accept ? "Accept" : "Reject")
			 << "best=" << v.best.id << v.best.name << "score=" << v.best.score
			 << "thr=" << v.threshold;
	return v;
}
