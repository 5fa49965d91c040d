#pragma once
#include "backend.hpp"

namespace engram {

// Accepts nothing, returns nothing. Used when no store is configured.
class NoneStore : public StoreBackend {
public:
    std::string backend_name() const override { return "none"; }

    void put_intervention(const Intervention&) override {}
    void put_reflection(const Reflection&) override {}

    std::vector<Intervention> scan_interventions(const std::string&, uint64_t,
                                                 const std::vector<Outcome>&) override { return {}; }

    uint32_t count_interventions(const std::string&, uint64_t) override { return 0; }

    std::vector<Reflection> recent_reflections(const std::string&, uint64_t,
                                               uint32_t) override { return {}; }

    uint32_t count_reflections(const std::string&, uint64_t) override { return 0; }

    uint32_t purge_expired(uint64_t) override { return 0; }
    uint32_t delete_user(const std::string&) override { return 0; }

    void ping() override {}
};

} // namespace engram
