#include "services/GalleryStore.hpp"

#include <QDebug>

FpStatus validateEnrollment(const Subject& subject, const FingerTemplate& tpl)
{
	if (subject.id <= 0 || subject.name.trimmed().isEmpty()) {
		qWarning() << "[Gallery] invalid subject id=" << subject.id << "name=" << subject.name;
		return FpStatus::InvalidInput;
	}
	if (tpl.primary.empty()) {
		qWarning() << "[Gallery] empty template for id=" << subject.id;
		return FpStatus::InvalidInput;
	}
	return FpStatus::Ok;
}

FpStatus MemoryGalleryStore::put(const Subject& subject, const FingerTemplate& tpl)
{
	const FpStatus v = validateEnrollment(subject, tpl);
	if (v != FpStatus::Ok) return v;
	if (templates_.count(subject.id)) return FpStatus::DuplicateId;

	FingerTemplate copy = tpl;
	copy.primary.descriptors = tpl.primary.descriptors.clone();
	copy.centroid = tpl.centroid.clone();

	templates_.emplace(subject.id, std::move(copy));
	subjects_.push_back(subject);
	return FpStatus::Ok;
}

FpStatus MemoryGalleryStore::getTemplate(int id, FingerTemplate& out) const
{
	auto it = templates_.find(id);
	if (it == templates_.end()) return FpStatus::NotFound;
	out = it->second;
	return FpStatus::Ok;
}

FpStatus MemoryGalleryStore::listSubjects(QVector<Subject>& out) const
{
	out = subjects_;
	return FpStatus::Ok;
}

bool MemoryGalleryStore::exists(int id, FpStatus* status) const
{
	if (status) *status = FpStatus::Ok;
	return templates_.count(id) > 0;
}
