#pragma once

#include <api/CommandModule.hpp>

// Built-in command handlers, bound to their keywords in CommandModules.cpp
DECLARE_COMMAND_HANDLER(add);
DECLARE_COMMAND_HANDLER(change);
DECLARE_COMMAND_HANDLER(phone);
DECLARE_COMMAND_HANDLER(all);
DECLARE_COMMAND_HANDLER(add_birthday);
DECLARE_COMMAND_HANDLER(show_birthday);
DECLARE_COMMAND_HANDLER(birthdays);
DECLARE_COMMAND_HANDLER(hello);
