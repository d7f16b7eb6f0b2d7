#include "berth/supervisor/supervisor.hpp"

#include "berth/isolation/boundary.hpp"

#include <sstream>

namespace berth::supervisor {

std::string render_unit(const UnitSpec &spec) {
  const auto boundary = isolation::derive_boundary(spec.service);
  std::ostringstream out;
  out << "[Unit]\n"
      << "Description=berth: " << spec.service << "\n"
      << "After=network-online.target\n"
      << "Wants=network-online.target\n"
      << "\n"
      << "[Service]\n"
      << "Type=simple\n"
      << "ExecStart=" << spec.exec_start.string() << "\n"
      << "EnvironmentFile=" << spec.environment_file.string() << "\n"
      << "Restart=on-failure\n"
      << "RestartSec=5\n"
      << "User=" << boundary.account << "\n"
      << "Group=" << boundary.account << "\n"
      << "WorkingDirectory=" << spec.working_directory.string() << "\n"
      << "\n"
      << "# Hardening\n"
      << "NoNewPrivileges=true\n"
      << "ProtectSystem=strict\n"
      << "ProtectHome=true\n"
      << "PrivateTmp=true\n"
      << "ReadWritePaths=" << spec.working_directory.string() << "\n"
      << "\n"
      << "[Install]\n"
      << "WantedBy=multi-user.target\n";
  return out.str();
}

} // namespace berth::supervisor
