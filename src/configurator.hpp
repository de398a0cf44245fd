#ifndef CONFIGURATOR_HPP
#define CONFIGURATOR_HPP

#include "install_context.hpp"

#include <cstddef>      // for size_t
#include <expected>     // for expected
#include <string_view>  // for string_view

namespace installer {

/// Configures the freshly installed root, step by step.
///
/// Locale, account and credential steps are essential and stop the run.
/// Services, firewall, theming and cleanup are best-effort: a failure is
/// recorded and the next step runs.
class Configurator final {
 public:
    explicit Configurator(const PipelineContext& ctx) noexcept
      : m_ctx(ctx) { }

    [[nodiscard]] auto run() noexcept -> std::expected<void, InstallError>;

    [[nodiscard]] auto set_locale_and_time() noexcept -> std::expected<void, InstallError>;
    void set_host() noexcept;
    [[nodiscard]] auto create_accounts() noexcept -> std::expected<void, InstallError>;
    void enable_core_services() noexcept;
    void setup_firewall() noexcept;
    void setup_zram() noexcept;
    void setup_cpu_governor() noexcept;
    void tune_fstab() noexcept;
    void setup_vm_guest() noexcept;
    void setup_ssh() noexcept;
    void render_theme() noexcept;
    void strip_footprint() noexcept;
    void finalize_system() noexcept;

    /// Number of best-effort steps which failed.
    [[nodiscard]] auto failed_steps() const noexcept -> std::size_t { return m_failed_steps; }

 private:
    void best_effort(bool is_ok, std::string_view step) noexcept;

    const PipelineContext& m_ctx;
    std::size_t m_failed_steps{};
};

}  // namespace installer

#endif  // CONFIGURATOR_HPP
