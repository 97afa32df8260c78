#pragma once

#include <scribe/interfaces.h>
#include <scribe/logging.h>
#include <scribe/resilient_caller.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace scribe {

struct SectionSpec {
  std::string name;
  std::string title;
};

const std::vector<SectionSpec> &SectionCatalog();
std::vector<std::string> DefaultSectionNames();

// Writes each section with the model chain and falls back to a
// deterministic markdown rendering of the model when no model answers.
class SynthesizingSectionGenerator : public SectionGenerator {
public:
  SynthesizingSectionGenerator(
      std::shared_ptr<ResilientCaller> caller,
      std::vector<std::string> model_chain,
      std::chrono::seconds timeout = std::chrono::seconds(120),
      std::shared_ptr<Logger> logger = nullptr);

  std::vector<std::string> SupportedSections() const override;
  SectionOutput Generate(const std::string &section_name,
                         const IntelligenceModel &model) override;

private:
  std::shared_ptr<ResilientCaller> caller_;
  std::vector<std::string> model_chain_;
  std::chrono::seconds timeout_;
  std::shared_ptr<Logger> logger_;
};

} // namespace scribe
