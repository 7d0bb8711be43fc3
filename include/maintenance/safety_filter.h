#ifndef SAFETY_FILTER_H
#define SAFETY_FILTER_H

#include "core/maintenance_config.h"
#include "maintenance/operation.h"
#include <iostream>
#include <string>
#include <vector>

class IConfirmationPrompt {
public:
  virtual ~IConfirmationPrompt() = default;

  // Returns true only on an explicit "yes".
  virtual bool confirm(const std::string &question) = 0;
};

class StreamConfirmationPrompt : public IConfirmationPrompt {
  std::istream &in_;
  std::ostream &out_;

public:
  StreamConfirmationPrompt(std::istream &in = std::cin,
                           std::ostream &out = std::cerr);

  bool confirm(const std::string &question) override;
};

struct SafetyResult {
  std::vector<Operation> plan;
  std::vector<Operation> skipped;
};

class SafetyFilter {
public:
  static constexpr const char *LARGE_TABLE_NOTE = "skipped: large table";
  static constexpr const char *CONFIRMATION_NOTE = "requires confirmation";

  // prompt may be null when no terminal is attached; destructive operations
  // are then dropped unless the policy already confirms them.
  SafetyFilter(SafetyPolicy policy, bool dryRun, IConfirmationPrompt *prompt);

  // Survivors keep their relative order. Removed operations come back in
  // state Skipped with the reason in their note.
  SafetyResult apply(std::vector<Operation> operations);

  bool promptShown() const { return promptShown_; }

private:
  bool isLarge(const Operation &op) const;
  bool confirmDestructive(size_t count);

  SafetyPolicy policy_;
  bool dryRun_;
  IConfirmationPrompt *prompt_;
  bool promptShown_ = false;
};

#endif
