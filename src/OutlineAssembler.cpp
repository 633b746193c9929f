#include "OutlineAssembler.hpp"

#include "TextNormalizer.hpp"

#include <utility>

namespace outline {

ClassifierState::ClassifierState(const std::string &title) {
  accept(title);
}

bool ClassifierState::contains(const std::string &lineText) const {
  return m_seen.count(toLowerText(lineText)) > 0;
}

void ClassifierState::accept(const std::string &lineText) {
  m_seen.insert(toLowerText(lineText));
}

OutlineAssembler::OutlineAssembler(const std::string &title)
    : m_title(title), m_state(title) {}

void OutlineAssembler::append(const OutlineEntry &entry,
                              const std::string &lineText) {
  m_entries.push_back(entry);
  m_state.accept(lineText);
}

void OutlineAssembler::finish(OutlineResult &result) {
  result.title = std::move(m_title);
  result.outline = std::move(m_entries);
  m_entries.clear();
}

} // namespace outline
