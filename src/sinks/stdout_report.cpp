#include "sinks/stdout_report.hpp"

#include <array>
#include <cstdio>

#include "core/timestamp.hpp"
#include "derived/hierarchy_id.hpp"

namespace monitoring_server::sinks {

namespace {

std::string format_fixed(const double value, const char* unit) {
  std::array<char, 64> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "%.1f %s", value, unit);
  return std::string(buffer.data());
}

std::string member_names(const std::vector<model::NodeInfo>& nodes) {
  std::string out;
  for (const auto& node : nodes) {
    if (!out.empty()) {
      out += ", ";
    }
    out += node.node_name;
  }
  return out;
}

}  // namespace

FleetSummary summarize_fleet(const model::FleetSnapshot& snapshot) noexcept {
  FleetSummary summary{};
  summary.node_count = snapshot.nodes.size();
  summary.soc_count = snapshot.socs.size();
  summary.board_count = snapshot.boards.size();
  if (snapshot.nodes.empty()) {
    return summary;
  }

  const auto totals = model::compute_totals(snapshot.nodes);
  summary.avg_cpu_usage = totals.total_cpu_usage;
  summary.avg_mem_usage = totals.total_mem_usage;
  summary.total_cpu_count = totals.total_cpu_count;
  summary.total_gpu_count = totals.total_gpu_count;
  return summary;
}

std::string format_bytes(const std::uint64_t bytes) {
  constexpr std::array<const char*, 5> kUnits{"B", "KB", "MB", "GB", "TB"};
  if (bytes < 1024U) {
    return std::to_string(bytes) + " B";
  }

  auto size = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (size >= 1024.0 && unit + 1 < kUnits.size()) {
    size /= 1024.0;
    ++unit;
  }
  return format_fixed(size, kUnits[unit]);
}

std::string format_memory(const std::uint64_t kb) {
  if (kb >= 1024U * 1024U) {
    return format_fixed(static_cast<double>(kb) / (1024.0 * 1024.0), "GB");
  }
  if (kb >= 1024U) {
    return format_fixed(static_cast<double>(kb) / 1024.0, "MB");
  }
  return std::to_string(kb) + " KB";
}

std::string format_time_ago(const std::uint64_t then_ns, const std::uint64_t now_ns) {
  if (then_ns > now_ns) {
    return "unknown";
  }

  const std::uint64_t secs = (now_ns - then_ns) / 1'000'000'000ULL;
  if (secs < 60U) {
    return std::to_string(secs) + "s ago";
  }
  if (secs < 3600U) {
    return std::to_string(secs / 60U) + "m ago";
  }
  return std::to_string(secs / 3600U) + "h ago";
}

void StdoutReportSink::publish_upsert(const model::NodeInfo& node, const model::SocInfo* soc,
                                      const model::BoardInfo* board) const {
  std::printf("[node] %s ip=%s cpu=%.2f%% cores=%llu gpus=%llu mem=%.2f%% used=%s total=%s rx=%s tx=%s read=%s "
              "write=%s os=%s arch=%s\n",
              node.node_name.c_str(), node.ip.c_str(), node.cpu_usage,
              static_cast<unsigned long long>(node.cpu_count), static_cast<unsigned long long>(node.gpu_count),
              node.mem_usage, format_memory(node.used_memory).c_str(), format_memory(node.total_memory).c_str(),
              format_bytes(node.rx_bytes).c_str(), format_bytes(node.tx_bytes).c_str(),
              format_bytes(node.read_bytes).c_str(), format_bytes(node.write_bytes).c_str(), node.os.c_str(),
              node.arch.c_str());

  const std::uint64_t now_ns = core::unix_timestamp_now_ns();
  if (soc != nullptr) {
    std::printf("[soc] %s nodes=%zu avg_cpu=%.2f%% avg_mem=%.2f%% cores=%llu gpus=%llu used=%s total=%s "
                "updated=%s members=[%s]\n",
                soc->soc_id.c_str(), soc->nodes.size(), soc->total_cpu_usage, soc->total_mem_usage,
                static_cast<unsigned long long>(soc->total_cpu_count),
                static_cast<unsigned long long>(soc->total_gpu_count), format_memory(soc->total_used_memory).c_str(),
                format_memory(soc->total_memory).c_str(), format_time_ago(soc->last_updated, now_ns).c_str(),
                member_names(soc->nodes).c_str());
  }

  if (board != nullptr) {
    std::string soc_ids;
    for (const auto& board_soc : board->socs) {
      if (!soc_ids.empty()) {
        soc_ids += ", ";
      }
      soc_ids += board_soc.soc_id;
    }
    std::printf("[board] %s nodes=%zu socs=%zu avg_cpu=%.2f%% avg_mem=%.2f%% cores=%llu gpus=%llu used=%s "
                "total=%s updated=%s soc_list=[%s]\n",
                board->board_id.c_str(), board->nodes.size(), board->socs.size(), board->total_cpu_usage,
                board->total_mem_usage, static_cast<unsigned long long>(board->total_cpu_count),
                static_cast<unsigned long long>(board->total_gpu_count),
                format_memory(board->total_used_memory).c_str(), format_memory(board->total_memory).c_str(),
                format_time_ago(board->last_updated, now_ns).c_str(), soc_ids.c_str());
  }
}

void StdoutReportSink::publish_overview(const model::FleetSnapshot& snapshot) const {
  for (const auto& node : snapshot.nodes) {
    const auto ids = derived::try_parse_ipv4(node.ip).has_value() ? derived::derive_hierarchy(node.ip)
                                                                  : derived::HierarchyId{};
    std::printf("[overview] node %s ip=%s soc=%s board=%s cpu=%.2f%% mem=%.2f%%\n", node.node_name.c_str(),
                node.ip.c_str(), ids.soc_id.c_str(), ids.board_id.c_str(), node.cpu_usage, node.mem_usage);
  }
  for (const auto& soc : snapshot.socs) {
    std::printf("[overview] soc %s nodes=%zu avg_cpu=%.2f%% avg_mem=%.2f%%\n", soc.soc_id.c_str(), soc.nodes.size(),
                soc.total_cpu_usage, soc.total_mem_usage);
  }
  for (const auto& board : snapshot.boards) {
    std::printf("[overview] board %s nodes=%zu socs=%zu avg_cpu=%.2f%% avg_mem=%.2f%%\n", board.board_id.c_str(),
                board.nodes.size(), board.socs.size(), board.total_cpu_usage, board.total_mem_usage);
  }

  const auto summary = summarize_fleet(snapshot);
  std::printf("[summary] nodes=%zu socs=%zu boards=%zu avg_cpu=%.2f%% avg_mem=%.2f%% cores=%llu gpus=%llu\n",
              summary.node_count, summary.soc_count, summary.board_count, summary.avg_cpu_usage,
              summary.avg_mem_usage, static_cast<unsigned long long>(summary.total_cpu_count),
              static_cast<unsigned long long>(summary.total_gpu_count));
  std::fflush(stdout);
}

}  // namespace monitoring_server::sinks
