#include "LoopSpec.hpp"

const char* loop_type_name(const LoopSpec& spec) {
    switch (spec.index()) {
        case 0: return "while";
        case 1: return "until";
        case 2: return "for";
        case 3: return "for_each";
        case 4: return "repeat";
        default: return "unknown";
    }
}
