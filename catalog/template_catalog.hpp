#ifndef CATALOG_TEMPLATE_CATALOG_HPP
#define CATALOG_TEMPLATE_CATALOG_HPP

#include <map>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "proto/template.pb.h"

namespace catalog {

// Named reusable snippets. Public templates are visible to everyone, private
// ones only to their owner.
class TemplateCatalog {
 public:
  // Adds or replaces the template with the same id. Throws
  // std::invalid_argument if the template has no id.
  void Add(const proto::Template& tmpl);

  // Adds every template of a text-format TemplateSet. Returns the number of
  // templates loaded.
  size_t LoadFromFile(const std::string& path);

  proto::FetchTemplateResponse Fetch(const std::string& template_id,
                                     const std::string& requester) const;

  // Visible, enabled templates sorted by name. LANGUAGE_UNSPECIFIED and an
  // empty category match everything.
  std::vector<proto::Template> List(const std::string& requester,
                                    proto::Language language,
                                    const std::string& category) const;

  size_t Size() const;

 private:
  static bool VisibleTo(const proto::Template& tmpl,
                        const std::string& requester);

  mutable absl::Mutex mutex_;
  std::map<std::string, proto::Template> templates_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace catalog

#endif
