#include "mode_controller.hpp"
#include <ncurses.h>

static constexpr int ESC = 27;

static bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == 127 || ch == 8; }

const std::string* ModeController::command_text() const {
  if (auto* cm = std::get_if<CommandMode>(&state_)) return &cm->text;
  return nullptr;
}

ModeController::Outcome ModeController::feed(int ch, std::string& command) {
  auto* cm = std::get_if<CommandMode>(&state_);
  if (!cm) {
    if (ch == kTriggerKey) { state_ = CommandMode{}; return Outcome::Consumed; }
    return Outcome::Navigate;
  }
  if (ch == ESC) { state_ = NormalMode{}; return Outcome::Consumed; }
  if (is_enter(ch)) {
    command = std::move(cm->text);
    state_ = NormalMode{};
    return Outcome::Execute;
  }
  if (is_backspace(ch)) { if (!cm->text.empty()) cm->text.pop_back(); return Outcome::Consumed; }
  if (ch >= 32 && ch <= 126) cm->text.push_back(static_cast<char>(ch));
  return Outcome::Consumed;
}
