#ifndef OUTLINE_OUTLINE_ASSEMBLER_HPP
#define OUTLINE_OUTLINE_ASSEMBLER_HPP

#include "OutlineTypes.hpp"

#include <set>
#include <string>
#include <vector>

namespace outline {

/**
 * @brief Texts already emitted as title or heading in one document
 *
 * Keys are lowercase full line texts. A state lives for one document only.
 */
class ClassifierState {
public:
  ClassifierState() = default;

  /**
   * @brief Create a state seeded with the lowercase title
   */
  explicit ClassifierState(const std::string &title);

  bool contains(const std::string &lineText) const;

  /**
   * @brief Record a line text as emitted
   */
  void accept(const std::string &lineText);

  size_t size() const { return m_seen.size(); }

private:
  std::set<std::string> m_seen;
};

/**
 * @brief Collects outline entries in the order they are accepted
 */
class OutlineAssembler {
public:
  explicit OutlineAssembler(const std::string &title);

  /**
   * @brief Append a heading and mark its raw line text as emitted
   * @param entry Heading entry
   * @param lineText Trimmed line text the entry was built from
   */
  void append(const OutlineEntry &entry, const std::string &lineText);

  const ClassifierState &state() const { return m_state; }
  const std::vector<OutlineEntry> &entries() const { return m_entries; }
  const std::string &title() const { return m_title; }

  /**
   * @brief Move the title and entries into a result
   */
  void finish(OutlineResult &result);

private:
  std::string m_title;
  ClassifierState m_state;
  std::vector<OutlineEntry> m_entries;
};

} // namespace outline

#endif // OUTLINE_OUTLINE_ASSEMBLER_HPP
