#include "terraforge/sim/protocol.hpp"

namespace terraforge {

std::string_view requestName(const Request& request) {
    switch (request.index()) {
        case 0: return "initialize";
        case 1: return "recompute";
        case 2: return "editAt";
    }
    return "unknown";
}

std::string_view phaseName(Phase phase) {
    switch (phase) {
        case Phase::Height: return "height";
        case Phase::Climate: return "climate";
        case Phase::Rivers: return "rivers";
    }
    return "unknown";
}

}  // namespace terraforge
