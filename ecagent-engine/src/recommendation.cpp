#include "recommendation.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ecagent {

std::string to_string(PracticeType type) {
    switch (type) {
        case PracticeType::SiltFence: return "silt_fence";
        case PracticeType::InletProtection: return "inlet_protection";
        case PracticeType::SedimentTrap: return "sediment_trap";
        case PracticeType::TemporarySeeding: return "temporary_seeding";
        case PracticeType::Mulch: return "mulch";
        case PracticeType::ErosionControlBlanket: return "erosion_control_blanket";
        case PracticeType::ConstructionEntrance: return "construction_entrance";
        case PracticeType::DustControl: return "dust_control";
        case PracticeType::PermanentSeeding: return "permanent_seeding";
        case PracticeType::Sodding: return "sodding";
        case PracticeType::Riprap: return "riprap";
        case PracticeType::RetainingWall: return "retaining_wall";
        case PracticeType::Bioswale: return "bioswale";
        case PracticeType::DetentionBasin: return "detention_basin";
    }
    return "unknown";
}

std::optional<PracticeType> parse_practice_type(const std::string& value) {
    static const PracticeType all_types[] = {
        PracticeType::SiltFence, PracticeType::InletProtection, PracticeType::SedimentTrap,
        PracticeType::TemporarySeeding, PracticeType::Mulch, PracticeType::ErosionControlBlanket,
        PracticeType::ConstructionEntrance, PracticeType::DustControl, PracticeType::PermanentSeeding,
        PracticeType::Sodding, PracticeType::Riprap, PracticeType::RetainingWall,
        PracticeType::Bioswale, PracticeType::DetentionBasin
    };

    for (PracticeType type : all_types) {
        if (to_string(type) == value) {
            return type;
        }
    }
    return std::nullopt;
}

std::string ECPractice::reference() const {
    return to_string(practice_type) + "_" + rule_id;
}

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace ecagent
