#include "EventClassifier.h"

bool isImportant(const MessageFlags& flags) {
    return flags.count(MessageFlag::Mentioned) > 0 || flags.count(MessageFlag::HasAlertWord) > 0;
}
