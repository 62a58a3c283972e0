#include "docgate/content/document.hpp"

#include "docgate/content/prioritizer.hpp"
#include "docgate/content/section.hpp"
#include "docgate/observability/global.hpp"

namespace docgate::content {

ShapedDocument shape_document(const std::string_view markdown, const std::size_t max_bytes) {
  ShapedDocument shaped;
  shaped.truncated = markdown.size() > max_bytes;

  const auto sections = extract_sections(markdown);
  shaped.sections_total = sections.size();
  if (sections.empty()) {
    return shaped;
  }

  shaped.sections_selected = select_sections(sections, max_bytes).size();
  shaped.content = prioritize_sections(sections, max_bytes);
  shaped.size_bytes = shaped.content.size();

  observability::record_metric(observability::SectionsSelectedMetric{
      .selected = shaped.sections_selected,
      .total = shaped.sections_total,
      .bytes = shaped.size_bytes});
  return shaped;
}

} // namespace docgate::content
