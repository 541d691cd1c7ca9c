#pragma once

#include <array>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "outline_config.hpp"
#include "outline_types.hpp"

/* Ancestor labels of the heading being read, one slot per level. Entering a
 * heading of depth d keeps slots [0, d) and clears everything deeper, so a
 * new H2 always closes the H3/H4 context opened below the previous H2.
 */
class Hierarchy_Path {
  public:
    static const unsigned int CAPACITY = 4;

    void enter(Heading_Level level, const std::string& text, unsigned int text_limit);

    // number of slots up to and including the deepest occupied one
    unsigned int depth() const;

    const std::optional<std::string>& slot(unsigned int depth) const { return slots_.at(depth); }

    std::vector<std::string> labels() const;

  private:
    std::array<std::optional<std::string>, CAPACITY> slots_;
};

struct Hierarchy_Decision {
    Heading_Candidate candidate;
    bool accepted = false;
    std::string reason;
    std::vector<std::string> path;
};

/* Consumes candidates of a whole document in reading order and keeps the
 * ones consistent with what has been accepted so far.
 */
class Hierarchy_Builder {
  public:
    explicit Hierarchy_Builder(const Outline_Config& config);

    // returns true if the candidate was appended to the outline
    bool consider(const Heading_Candidate& candidate);

    const std::vector<Outline_Item>& outline() const { return outline_; }

    const Hierarchy_Path& path() const { return path_; }

    const std::vector<Hierarchy_Decision>& trace() const { return trace_; }

  private:
    std::optional<std::string> rejection_reason(const Heading_Candidate& candidate) const;

    bool is_contextual_duplicate(const std::string& text) const;

    void record(const Heading_Candidate& candidate, bool accepted, std::string reason);

    const Outline_Config& config_;
    Hierarchy_Path path_;
    std::unordered_set<std::string> seen_texts_;  // lower cased, trimmed
    std::vector<Outline_Item> outline_;
    std::vector<Hierarchy_Decision> trace_;
};

// sorts candidates into reading order, filters them and caps the outline length
std::vector<Outline_Item> build_document_hierarchy(std::vector<Heading_Candidate> candidates,
                                                   const Outline_Config& config,
                                                   std::vector<Hierarchy_Decision>* trace = nullptr);
