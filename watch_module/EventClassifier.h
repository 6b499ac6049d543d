#pragma once

#include "Event.h"

// Важное = упоминание или alert word. read и прочие флаги не влияют.
bool isImportant(const MessageFlags& flags);
