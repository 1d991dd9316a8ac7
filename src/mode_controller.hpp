#pragma once
/*
 * ModeController
 *
 * Purpose: Normal/Command state machine deciding where a keystroke goes.
 * Design: tagged union; the command text lives in the Command payload, so it
 *         cannot be observed while in Normal mode.
 * Flow: Normal --':'--> Command --Enter(execute)/Esc(cancel)--> Normal.
 */
#include <string>
#include <variant>

struct NormalMode {};
struct CommandMode { std::string text; };

class ModeController {
public:
  enum class Outcome {
    Navigate,  // Normal mode key: route to pane operations
    Consumed,  // handled here (mode change or text edit)
    Execute,   // Enter in Command mode; command holds the text
  };
  static constexpr int kTriggerKey = ':';

  Outcome feed(int ch, std::string& command);
  bool in_command() const { return std::holds_alternative<CommandMode>(state_); }
  // nullptr in Normal mode
  const std::string* command_text() const;
  const char* mode_name() const { return in_command() ? "COMMAND" : "NORMAL"; }

private:
  std::variant<NormalMode, CommandMode> state_;
};
