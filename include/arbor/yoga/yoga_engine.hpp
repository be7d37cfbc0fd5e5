#pragma once

/// @file yoga_engine.hpp
/// @brief LayoutEngine backed by the Yoga flexbox library

#include <arbor/ui/layout.hpp>

struct YGConfig;

namespace arbor_yoga {

/// Builds a Yoga node tree per solve, lays it out and reads the boxes back.
/// Nodes are not kept between solves.
class YogaLayoutEngine : public arbor_ui::LayoutEngine {
public:
    YogaLayoutEngine();
    ~YogaLayoutEngine() override;

    // Non-copyable
    YogaLayoutEngine(const YogaLayoutEngine&) = delete;
    YogaLayoutEngine& operator=(const YogaLayoutEngine&) = delete;

    [[nodiscard]] arbor_core::Result<std::vector<arbor_ui::LayoutOutput>> solve(
        const arbor_ui::LayoutInput& input, arbor_ui::Size available) override;

private:
    YGConfig* m_config = nullptr;
};

} // namespace arbor_yoga
