#include "catalog/template_catalog.hpp"

#include <algorithm>
#include <stdexcept>

#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "util/file.hpp"

namespace catalog {

bool TemplateCatalog::VisibleTo(const proto::Template& tmpl,
                                const std::string& requester) {
  if (tmpl.visibility() != proto::Template::PRIVATE) return true;
  return !requester.empty() && tmpl.owner_id() == requester;
}

void TemplateCatalog::Add(const proto::Template& tmpl) {
  if (tmpl.id().empty()) {
    throw std::invalid_argument("Template without id: " + tmpl.name());
  }
  absl::MutexLock lck(&mutex_);
  templates_[tmpl.id()] = tmpl;
}

size_t TemplateCatalog::LoadFromFile(const std::string& path) {
  proto::TemplateSet set;
  if (!google::protobuf::TextFormat::ParseFromString(util::File::ReadAll(path),
                                                     &set)) {
    throw std::runtime_error("Unable to parse template file " + path);
  }
  for (const proto::Template& tmpl : set.templates()) Add(tmpl);
  LOG(INFO) << "Loaded " << set.templates_size() << " templates from " << path;
  return set.templates_size();
}

proto::FetchTemplateResponse TemplateCatalog::Fetch(
    const std::string& template_id, const std::string& requester) const {
  proto::FetchTemplateResponse response;
  absl::MutexLock lck(&mutex_);
  auto it = templates_.find(template_id);
  if (it == templates_.end() || it->second.disabled()) {
    response.set_outcome(proto::FetchTemplateResponse::NOT_FOUND);
    return response;
  }
  if (!VisibleTo(it->second, requester)) {
    response.set_outcome(proto::FetchTemplateResponse::FORBIDDEN);
    return response;
  }
  response.set_outcome(proto::FetchTemplateResponse::FOUND);
  *response.mutable_found() = it->second;
  return response;
}

std::vector<proto::Template> TemplateCatalog::List(
    const std::string& requester, proto::Language language,
    const std::string& category) const {
  std::vector<proto::Template> found;
  {
    absl::MutexLock lck(&mutex_);
    for (const auto& kv : templates_) {
      const proto::Template& tmpl = kv.second;
      if (tmpl.disabled() || !VisibleTo(tmpl, requester)) continue;
      if (language != proto::LANGUAGE_UNSPECIFIED &&
          tmpl.language() != language) {
        continue;
      }
      if (!category.empty() && tmpl.category() != category) continue;
      found.push_back(tmpl);
    }
  }
  std::stable_sort(found.begin(), found.end(),
                   [](const proto::Template& a, const proto::Template& b) {
                     return a.name() < b.name();
                   });
  return found;
}

size_t TemplateCatalog::Size() const {
  absl::MutexLock lck(&mutex_);
  return templates_.size();
}

}  // namespace catalog
