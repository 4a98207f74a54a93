#include "CommandModule.h"

DECLARE_COMMAND_HANDLER(hello) { return "How can I help you?"; }
