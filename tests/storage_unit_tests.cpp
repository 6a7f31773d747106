#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "model/aggregates.hpp"
#include "model/node_info.hpp"
#include "storage/kv_store.hpp"
#include "storage/monitoring_repository.hpp"
#include "storage/redis_kv_store.hpp"

using monitoring_server::model::BoardInfo;
using monitoring_server::model::NodeInfo;
using monitoring_server::model::SocInfo;
using monitoring_server::storage::DeserializationError;
using monitoring_server::storage::MonitoringRepository;
using monitoring_server::storage::RedisKvStore;
using monitoring_server::storage::RedisOptions;
using monitoring_server::storage::StorageError;
using monitoring_server::storage::board_key;
using monitoring_server::storage::make_in_memory_kv_store;
using monitoring_server::storage::node_key;
using monitoring_server::storage::soc_key;

namespace {

struct RedisMockState {
  std::map<std::string, std::string> data{};
  std::vector<std::string> formats{};
  std::vector<std::vector<std::string>> commands{};
  std::set<std::string> vanish_before_mget{};
  std::size_t scan_page_size{2};
  int connects{0};
  int drop_next_commands{0};
  bool connect_fails{false};
  bool reject_auth{false};
  bool error_next_command{false};
};

RedisMockState g_redis_mock{};

void reset_redis_mock() { g_redis_mock = RedisMockState{}; }

redisContext* new_context() {
  ++g_redis_mock.connects;
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  if (g_redis_mock.connect_fails) {
    context->err = REDIS_ERR_IO;
    std::snprintf(context->errstr, sizeof(context->errstr), "%s", "Connection refused");
  } else {
    context->err = REDIS_OK;
  }
  return context;
}

redisReply* new_reply(int type) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = type;
  return reply;
}

redisReply* new_string_reply(const std::string& value, int type = REDIS_REPLY_STRING) {
  auto* reply = new_reply(type);
  reply->str = static_cast<char*>(std::malloc(value.size() + 1));
  std::memcpy(reply->str, value.data(), value.size());
  reply->str[value.size()] = '\0';
  reply->len = value.size();
  return reply;
}

redisReply* new_array_reply(const std::vector<redisReply*>& items) {
  auto* reply = new_reply(REDIS_REPLY_ARRAY);
  reply->elements = items.size();
  reply->element = static_cast<redisReply**>(std::calloc(items.empty() ? 1 : items.size(), sizeof(redisReply*)));
  for (std::size_t i = 0; i < items.size(); ++i) {
    reply->element[i] = items[i];
  }
  return reply;
}

// Only handles the "<escaped prefix>*" patterns the client sends.
std::string unescape_prefix_pattern(const std::string& pattern) {
  std::string prefix;
  for (std::size_t i = 0; i + 1 < pattern.size(); ++i) {
    if (pattern[i] == '\\' && i + 2 < pattern.size()) {
      ++i;
    }
    prefix.push_back(pattern[i]);
  }
  return prefix;
}

redisReply* handle_scan(const std::vector<std::string>& args) {
  const std::size_t cursor = std::stoul(args[1]);
  const std::string prefix = unescape_prefix_pattern(args[3]);

  std::vector<std::string> matching;
  for (const auto& [key, _] : g_redis_mock.data) {
    if (key.compare(0, prefix.size(), prefix) == 0) {
      matching.push_back(key);
    }
  }

  std::vector<redisReply*> page;
  std::size_t next = cursor;
  while (next < matching.size() && page.size() < g_redis_mock.scan_page_size) {
    page.push_back(new_string_reply(matching[next++]));
  }
  // Real SCAN may return a key twice across pages.
  if (!page.empty() && next < matching.size()) {
    page.push_back(new_string_reply(matching[next - 1]));
  }

  const std::string next_cursor = next >= matching.size() ? "0" : std::to_string(next);
  return new_array_reply({new_string_reply(next_cursor), new_array_reply(page)});
}

redisReply* handle_command(const std::vector<std::string>& args) {
  const std::string& name = args.front();
  if (name == "SET") {
    g_redis_mock.data[args[1]] = args[2];
    return new_string_reply("OK", REDIS_REPLY_STATUS);
  }
  if (name == "GET") {
    const auto it = g_redis_mock.data.find(args[1]);
    return it == g_redis_mock.data.end() ? new_reply(REDIS_REPLY_NIL) : new_string_reply(it->second);
  }
  if (name == "DEL") {
    auto* reply = new_reply(REDIS_REPLY_INTEGER);
    reply->integer = static_cast<long long>(g_redis_mock.data.erase(args[1]));
    return reply;
  }
  if (name == "SCAN") {
    return handle_scan(args);
  }
  if (name == "MGET") {
    for (const auto& key : g_redis_mock.vanish_before_mget) {
      g_redis_mock.data.erase(key);
    }
    std::vector<redisReply*> values;
    for (std::size_t i = 1; i < args.size(); ++i) {
      const auto it = g_redis_mock.data.find(args[i]);
      values.push_back(it == g_redis_mock.data.end() ? new_reply(REDIS_REPLY_NIL) : new_string_reply(it->second));
    }
    return new_array_reply(values);
  }
  return new_string_reply("ERR unknown command", REDIS_REPLY_ERROR);
}

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) { return new_context(); }

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) { return new_context(); }

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char* format, ...) {
  g_redis_mock.formats.emplace_back(format);
  if (g_redis_mock.reject_auth && std::strncmp(format, "AUTH", 4) == 0) {
    return new_string_reply("WRONGPASS invalid password", REDIS_REPLY_ERROR);
  }
  return new_string_reply("OK", REDIS_REPLY_STATUS);
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t* argvlen) {
  if (g_redis_mock.drop_next_commands > 0) {
    --g_redis_mock.drop_next_commands;
    return nullptr;
  }

  std::vector<std::string> args;
  for (int i = 0; i < argc; ++i) {
    args.emplace_back(argv[i], argvlen[i]);
  }
  g_redis_mock.commands.push_back(args);

  if (g_redis_mock.error_next_command) {
    g_redis_mock.error_next_command = false;
    return new_string_reply("ERR simulated failure", REDIS_REPLY_ERROR);
  }
  return handle_command(args);
}

void freeReplyObject(void* reply) {
  auto* r = static_cast<redisReply*>(reply);
  if (r == nullptr) {
    return;
  }
  for (std::size_t i = 0; i < r->elements; ++i) {
    freeReplyObject(r->element[i]);
  }
  std::free(r->element);
  std::free(r->str);
  std::free(r);
}

}  // extern "C"

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

NodeInfo make_node(const std::string& name, const std::string& ip, double cpu) {
  NodeInfo node{};
  node.node_name = name;
  node.ip = ip;
  node.cpu_usage = cpu;
  node.mem_usage = 25.0;
  node.cpu_count = 8;
  node.gpu_count = 2;
  node.used_memory = 1048576;
  node.total_memory = 4194304;
  node.rx_bytes = 1ULL << 40;
  node.os = "ubuntu";
  node.arch = "x86_64";
  return node;
}

SocInfo make_soc(const std::string& soc_id, const std::vector<NodeInfo>& nodes) {
  SocInfo soc{};
  soc.soc_id = soc_id;
  soc.nodes = nodes;
  static_cast<monitoring_server::model::AggregateTotals&>(soc) = monitoring_server::model::compute_totals(nodes);
  soc.last_updated = 1700000000000000000ULL;
  return soc;
}

int test_keys_use_monitoring_namespace() {
  if (node_key("n1") != "monitoring/nodes/n1" || soc_key("10.0.0.200") != "monitoring/socs/10.0.0.200" ||
      board_key("10.0.0.200") != "monitoring/boards/10.0.0.200") {
    return fail("test_keys_use_monitoring_namespace", "unexpected key layout");
  }
  return 0;
}

int test_repository_stores_and_reads_records() {
  auto backend = make_in_memory_kv_store();
  MonitoringRepository repository(*backend);

  const auto n1 = make_node("n1", "10.0.0.201", 50.0);
  const auto n2 = make_node("n2", "10.0.0.215", 10.0);
  const auto soc = make_soc("10.0.0.200", {n1});

  BoardInfo board{};
  board.board_id = "10.0.0.200";
  board.nodes = {n1, n2};
  board.socs = {soc, make_soc("10.0.0.210", {n2})};
  static_cast<monitoring_server::model::AggregateTotals&>(board) = monitoring_server::model::compute_totals(board.nodes);
  board.last_updated = 42;

  repository.store_node(n1);
  repository.store_node(n2);
  repository.store_soc(soc);
  repository.store_board(board);

  const auto loaded_node = repository.get_node("n1");
  if (!loaded_node.has_value() || loaded_node->ip != "10.0.0.201" || loaded_node->rx_bytes != (1ULL << 40) ||
      loaded_node->arch != "x86_64") {
    return fail("test_repository_stores_and_reads_records", "node fields lost in storage");
  }

  const auto loaded_board = repository.get_board("10.0.0.200");
  if (!loaded_board.has_value() || loaded_board->socs.size() != 2 || loaded_board->socs[1].nodes[0].node_name != "n2" ||
      !almost_equal(loaded_board->total_cpu_usage, 30.0) || loaded_board->last_updated != 42) {
    return fail("test_repository_stores_and_reads_records", "board document lost nested data");
  }

  const auto raw = nlohmann::json::parse(*backend->get(soc_key("10.0.0.200")));
  if (!raw.contains("total_cpu_usage") || !raw.contains("total_write_bytes") || !raw.contains("last_updated") ||
      raw.at("nodes").size() != 1) {
    return fail("test_repository_stores_and_reads_records", "soc document is missing fields");
  }

  if (repository.get_node("missing").has_value() || repository.get_soc("10.0.0.250").has_value()) {
    return fail("test_repository_stores_and_reads_records", "absent keys should read as empty");
  }

  const auto nodes = repository.get_all_nodes();
  if (nodes.size() != 2 || repository.get_all_socs().size() != 1 || repository.get_all_boards().size() != 1) {
    return fail("test_repository_stores_and_reads_records", "listings should be scoped by prefix");
  }
  return 0;
}

int test_repository_listing_skips_corrupt_records() {
  auto backend = make_in_memory_kv_store();
  MonitoringRepository repository(*backend);

  repository.store_node(make_node("good", "10.0.0.1", 5.0));
  backend->put(node_key("broken"), "{not json");
  backend->put(node_key("nameless"), "{\"ip\":\"10.0.0.2\"}");

  const auto nodes = repository.get_all_nodes();
  if (nodes.size() != 1 || nodes[0].node_name != "good") {
    return fail("test_repository_listing_skips_corrupt_records", "listing should return only decodable records");
  }
  if (repository.skipped_records() != 2) {
    return fail("test_repository_listing_skips_corrupt_records", "skipped records should be counted");
  }

  bool threw = false;
  try {
    (void)repository.get_node("broken");
  } catch (const DeserializationError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_repository_listing_skips_corrupt_records", "single lookup of a corrupt record should throw");
  }
  return 0;
}

int test_repository_deletes_records() {
  auto backend = make_in_memory_kv_store();
  MonitoringRepository repository(*backend);

  const auto node = make_node("n1", "10.0.0.1", 5.0);
  repository.store_node(node);
  repository.store_soc(make_soc("10.0.0.0", {node}));

  repository.delete_node("n1");
  repository.delete_soc("10.0.0.0");
  repository.delete_board("10.0.0.0");

  if (repository.get_node("n1").has_value() || repository.get_soc("10.0.0.0").has_value() ||
      !backend->list_by_prefix("monitoring/").empty()) {
    return fail("test_repository_deletes_records", "deleted records are still readable");
  }
  return 0;
}

int test_redis_store_commands() {
  reset_redis_mock();
  RedisKvStore store(RedisOptions{});

  store.put("monitoring/nodes/n1", "{\"a\":1}");
  const auto value = store.get("monitoring/nodes/n1");
  if (!value.has_value() || *value != "{\"a\":1}") {
    return fail("test_redis_store_commands", "GET should return the SET value");
  }
  if (store.get("monitoring/nodes/none").has_value()) {
    return fail("test_redis_store_commands", "nil reply should read as empty");
  }

  store.remove("monitoring/nodes/n1");
  if (!g_redis_mock.data.empty()) {
    return fail("test_redis_store_commands", "DEL should remove the key");
  }

  const std::vector<std::string> expected_set{"SET", "monitoring/nodes/n1", "{\"a\":1}"};
  if (g_redis_mock.commands.empty() || g_redis_mock.commands.front() != expected_set) {
    return fail("test_redis_store_commands", "SET should be sent with binary-safe argv");
  }
  if (g_redis_mock.connects != 1 || !g_redis_mock.formats.empty()) {
    return fail("test_redis_store_commands", "default options should connect once without AUTH/SELECT");
  }
  return 0;
}

int test_redis_store_lists_prefix_across_scan_pages() {
  reset_redis_mock();
  RedisKvStore store(RedisOptions{});
  MonitoringRepository repository(store);

  for (int i = 0; i < 5; ++i) {
    repository.store_node(make_node("n" + std::to_string(i), "10.0.0." + std::to_string(i), 1.0 * i));
  }
  repository.store_soc(make_soc("10.0.0.0", {}));
  g_redis_mock.vanish_before_mget.insert(node_key("n3"));

  const auto nodes = repository.get_all_nodes();
  if (nodes.size() != 4) {
    return fail("test_redis_store_lists_prefix_across_scan_pages", "expected four surviving nodes");
  }
  for (std::size_t i = 1; i < nodes.size(); ++i) {
    if (nodes[i - 1].node_name >= nodes[i].node_name) {
      return fail("test_redis_store_lists_prefix_across_scan_pages", "listing should be sorted and deduplicated");
    }
  }
  if (repository.skipped_records() != 0) {
    return fail("test_redis_store_lists_prefix_across_scan_pages", "a key gone before MGET is not a corrupt record");
  }

  int scans = 0;
  for (const auto& command : g_redis_mock.commands) {
    if (command.front() == "SCAN") {
      ++scans;
      if (command[2] != "MATCH" || command[3] != "monitoring/nodes/*") {
        return fail("test_redis_store_lists_prefix_across_scan_pages", "SCAN should match on the key prefix");
      }
    }
  }
  if (scans != 3) {
    return fail("test_redis_store_lists_prefix_across_scan_pages", "SCAN should follow the cursor to zero");
  }
  return 0;
}

int test_redis_store_escapes_glob_characters() {
  reset_redis_mock();
  RedisKvStore store(RedisOptions{});
  store.put("odd*key", "1");
  store.put("oddity", "2");

  const auto entries = store.list_by_prefix("odd*");
  const auto& scan = g_redis_mock.commands.back().front() == "MGET" ? g_redis_mock.commands[g_redis_mock.commands.size() - 2]
                                                                   : g_redis_mock.commands.back();
  if (scan.front() != "SCAN" || scan[3] != "odd\\**") {
    return fail("test_redis_store_escapes_glob_characters", "glob metacharacters in the prefix should be escaped");
  }
  if (entries.size() != 1 || entries[0].key != "odd*key" || entries[0].value != "1") {
    return fail("test_redis_store_escapes_glob_characters", "prefix should be matched literally");
  }
  return 0;
}

int test_redis_store_reconnects_once() {
  reset_redis_mock();
  RedisKvStore store(RedisOptions{});

  g_redis_mock.drop_next_commands = 1;
  store.put("k", "v");
  if (g_redis_mock.connects != 2 || g_redis_mock.data["k"] != "v") {
    return fail("test_redis_store_reconnects_once", "a dropped command should be retried after reconnecting");
  }

  g_redis_mock.drop_next_commands = 2;
  bool threw = false;
  try {
    store.put("k", "w");
  } catch (const StorageError&) {
    threw = true;
  }
  if (!threw || g_redis_mock.data["k"] != "v") {
    return fail("test_redis_store_reconnects_once", "a second consecutive drop should surface as StorageError");
  }
  return 0;
}

int test_redis_store_reports_errors() {
  reset_redis_mock();
  {
    RedisKvStore store(RedisOptions{});
    g_redis_mock.error_next_command = true;
    bool threw = false;
    try {
      store.put("k", "v");
    } catch (const StorageError& ex) {
      threw = std::string(ex.what()).find("ERR simulated failure") != std::string::npos;
    }
    if (!threw) {
      return fail("test_redis_store_reports_errors", "error replies should raise StorageError with the message");
    }
  }

  reset_redis_mock();
  g_redis_mock.connect_fails = true;
  RedisOptions options{};
  options.unix_socket = "/tmp/redis.sock";
  RedisKvStore unreachable(options);
  if (unreachable.check_connectivity() || unreachable.endpoint() != "unix:///tmp/redis.sock") {
    return fail("test_redis_store_reports_errors", "failed connect should be reported");
  }
  bool threw = false;
  try {
    (void)unreachable.get("k");
  } catch (const StorageError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_redis_store_reports_errors", "commands on an unreachable server should throw");
  }
  return 0;
}

int test_redis_store_authenticates_and_selects_db() {
  reset_redis_mock();
  RedisOptions options{};
  options.password = "secret";
  options.db = 3;
  RedisKvStore store(options);

  if (!store.check_connectivity()) {
    return fail("test_redis_store_authenticates_and_selects_db", "connect should succeed");
  }
  const std::vector<std::string> expected{"AUTH %s", "SELECT %d"};
  if (g_redis_mock.formats != expected) {
    return fail("test_redis_store_authenticates_and_selects_db", "AUTH then SELECT should follow connect");
  }

  reset_redis_mock();
  g_redis_mock.reject_auth = true;
  RedisKvStore rejected(options);
  if (rejected.check_connectivity()) {
    return fail("test_redis_store_authenticates_and_selects_db", "rejected AUTH should fail the connection");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_keys_use_monitoring_namespace(); rc != 0) {
    return rc;
  }
  if (int rc = test_repository_stores_and_reads_records(); rc != 0) {
    return rc;
  }
  if (int rc = test_repository_listing_skips_corrupt_records(); rc != 0) {
    return rc;
  }
  if (int rc = test_repository_deletes_records(); rc != 0) {
    return rc;
  }
  if (int rc = test_redis_store_commands(); rc != 0) {
    return rc;
  }
  if (int rc = test_redis_store_lists_prefix_across_scan_pages(); rc != 0) {
    return rc;
  }
  if (int rc = test_redis_store_escapes_glob_characters(); rc != 0) {
    return rc;
  }
  if (int rc = test_redis_store_reconnects_once(); rc != 0) {
    return rc;
  }
  if (int rc = test_redis_store_reports_errors(); rc != 0) {
    return rc;
  }
  if (int rc = test_redis_store_authenticates_and_selects_db(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] storage unit tests\n";
  return 0;
}
