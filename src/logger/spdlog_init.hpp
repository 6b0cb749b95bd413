#pragma once

namespace cfg2 {
struct GeneralSection;
}

namespace herder::logging {

// Initialize the default spdlog logger from the [general] section
void init_spdlog(const cfg2::GeneralSection &general_section);

} // namespace herder::logging
