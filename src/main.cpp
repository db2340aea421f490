#include "taskq/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("taskq - weighted task queue with retrying workers");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve                 Run the worker pool until SIGINT/SIGTERM");
  std::println("  schedule              Enqueue configured cron jobs until SIGINT/SIGTERM");
  std::println("  enqueue               Enqueue a task");
  std::println("  stats                 Print aggregate and per-queue stats");
  std::println("  jobs                  List queued tasks of a queue");
  std::println("  failed                List failed tasks of a queue");
  std::println("  retry                 Requeue a failed task");
  std::println("  delete                Delete a failed task");
  std::println("  call                  Invoke an admin endpoint in-process");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           SQLite file (overrides config)");
  std::println("  --log-file <file>     Log file (serve, schedule)");
  std::println("  --type <type>         Task type, e.g. order:archive (enqueue)");
  std::println("  --payload <json>      Task payload (enqueue, default {{}})");
  std::println("  -q, --queue <name>    Queue name");
  std::println("  --max-retry <n>       Retry budget (enqueue)");
  std::println("  --delay-ms <n>        Process no earlier than now + n ms");
  std::println("  --timeout-ms <n>      Per-task processing deadline");
  std::println("  --id <task_id>        Task id (retry, delete)");
  std::println("  --page <n>            Page number (jobs, failed)");
  std::println("  --page-size <n>       Page size, at most 100 (jobs, failed)");
  std::println("  --method <verb>       HTTP method (call, default GET)");
  std::println("  --target <path>       Path and query (call)");
  std::println("  --actor <name>        Audit actor, sent as X-Actor-ID (call)");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} serve -c taskq.yaml", prog);
  std::println(
      "  {} enqueue --type order:archive --payload '{{\"order_id\":\"...\"}}'",
      prog);
  std::println("  {} failed --queue default --page 2", prog);
  std::println("  {} call --target '/admin/queues/low/jobs?page_size=5'", prog);
}

struct Args {
  std::string command;
  std::string config_file;
  std::string db_file;
  std::string log_file;
  std::string type;
  std::string payload{"{}"};
  std::string queue;
  std::string task_id;
  std::string method{"GET"};
  std::string target;
  std::string actor;
  int max_retry{-1};
  int delay_ms{0};
  int timeout_ms{0};
  int page{1};
  int page_size{20};
};

auto parse_int(std::string_view flag, std::string_view value) -> int {
  int out = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    std::println(stderr, "Error: {} expects an integer, got '{}'", flag, value);
    std::exit(1);
  }
  return out;
}

auto parse_args(int argc, char* argv[]) -> Args {
  Args args;
  if (argc < 2) {
    print_usage(argv[0]);
    std::exit(1);
  }
  args.command = argv[1];
  if (args.command == "-h" || args.command == "--help") {
    print_usage(argv[0]);
    std::exit(0);
  }

  auto value = [&](int& i, std::string_view flag) -> std::string {
    if (++i >= argc) {
      std::println(stderr, "Error: {} requires an argument", flag);
      std::exit(1);
    }
    return argv[i];
  };

  for (int i = 2; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      args.config_file = value(i, arg);
    } else if (arg == "--db") {
      args.db_file = value(i, arg);
    } else if (arg == "--log-file") {
      args.log_file = value(i, arg);
    } else if (arg == "--type") {
      args.type = value(i, arg);
    } else if (arg == "--payload") {
      args.payload = value(i, arg);
    } else if (arg == "-q" || arg == "--queue") {
      args.queue = value(i, arg);
    } else if (arg == "--id") {
      args.task_id = value(i, arg);
    } else if (arg == "--method") {
      args.method = value(i, arg);
    } else if (arg == "--target") {
      args.target = value(i, arg);
    } else if (arg == "--actor") {
      args.actor = value(i, arg);
    } else if (arg == "--max-retry") {
      args.max_retry = parse_int(arg, value(i, arg));
    } else if (arg == "--delay-ms") {
      args.delay_ms = parse_int(arg, value(i, arg));
    } else if (arg == "--timeout-ms") {
      args.timeout_ms = parse_int(arg, value(i, arg));
    } else if (arg == "--page") {
      args.page = parse_int(arg, value(i, arg));
    } else if (arg == "--page-size") {
      args.page_size = parse_int(arg, value(i, arg));
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace taskq::cli;

  auto args = parse_args(argc, argv);
  CommonOptions common{args.config_file, args.db_file};

  if (args.command == "serve" || args.command == "schedule") {
    ServeOptions opts{common, std::nullopt};
    if (!args.log_file.empty()) {
      opts.log_file = args.log_file;
    }
    return args.command == "serve" ? cmd_serve(opts) : cmd_schedule(opts);
  }
  if (args.command == "enqueue") {
    EnqueueOptions opts;
    opts.common = common;
    opts.type = args.type;
    opts.payload = args.payload;
    if (!args.queue.empty()) {
      opts.queue = args.queue;
    }
    if (args.max_retry >= 0) {
      opts.max_retry = args.max_retry;
    }
    opts.delay_ms = args.delay_ms;
    opts.timeout_ms = args.timeout_ms;
    return cmd_enqueue(opts);
  }
  if (args.command == "stats") {
    return cmd_stats(common);
  }
  if (args.command == "jobs" || args.command == "failed") {
    ListOptions opts{common, args.queue, args.page, args.page_size};
    return args.command == "jobs" ? cmd_jobs(opts) : cmd_failed(opts);
  }
  if (args.command == "retry" || args.command == "delete") {
    if (args.task_id.empty()) {
      std::println(stderr, "Error: --id is required");
      return 1;
    }
    TaskOptions opts{common, args.queue, args.task_id};
    return args.command == "retry" ? cmd_retry(opts) : cmd_delete(opts);
  }
  if (args.command == "call") {
    return cmd_call(CallOptions{common, args.method, args.target, args.actor});
  }

  std::println(stderr, "Unknown command: {}", args.command);
  print_usage(argv[0]);
  return 1;
}
