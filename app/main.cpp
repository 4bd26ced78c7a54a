#include <iostream>
#include <string>

#include "io/demo_io.hpp"
#include "io/output_writer.hpp"
#include "pipeline/pipeline.hpp"
#include "store/trajectory_store.hpp"

int main(int argc, char** argv) {
  // 默认使用 demo/input 和 demo/output
  //   ./formation_demo
  // 或指定路径：
  //   ./formation_demo /path/to/input /path/to/output
  std::string input_dir  = "demo/input";
  std::string output_dir = "demo/output";

  if (argc >= 2) input_dir = argv[1];
  if (argc >= 3) output_dir = argv[2];

  try {
    // 1) 读取输入
    formation::MatchingContext ctx = formation::io::DemoIO::LoadContext(input_dir);
    std::cout << "Loaded " << ctx.flights.size() << " flights, "
              << ctx.departure_requests.size() << " departure requests\n";

    // 2) 航迹索引（只读，生命周期覆盖整个流程）
    formation::InMemoryTrajectoryStore store;
    store.AddFlights(ctx.flights);
    ctx.store = &store;
    std::cout << "Indexed " << store.FlightCount() << " trajectories\n";

    // 3) 跑流程；pairs.json 已给出配对时跳过配对发现
    formation::Pipeline pipe;
    if (!ctx.pairs.empty()) {
      std::cout << "Using " << ctx.pairs.size() << " pairs from input\n";
      pipe.RunFromPairs(ctx);
    } else {
      pipe.Run(ctx);
    }

    std::cout << "Pairs: " << ctx.pairs.size()
              << ", edges: " << ctx.edges.size()
              << ", corridors: " << ctx.corridors.size()
              << ", optimized paths: " << ctx.optimized_paths.size()
              << ", recommendations: " << ctx.recommendations.size() << "\n";
    if (!ctx.optimized_paths.empty()) {
      const auto& top = ctx.optimized_paths.front();
      std::cout << "Best path: " << top.flight_id << " saves " << top.time_savings_minutes << " min\n";
    }
    const auto& s = ctx.skipped;
    std::cout << "Skipped: missing_coordinates=" << s.flights_missing_coordinates
              << " degenerate_course=" << s.flights_degenerate_course
              << " non_positive_duration=" << s.pairs_non_positive_duration
              << " unknown_flight=" << s.pairs_unknown_flight
              << " solver_failures=" << s.corridor_solver_failures
              << " unresolved_requests=" << s.requests_unresolved << "\n";

    // 4) 输出
    formation::io::OutputWriter::WriteAll(ctx, output_dir);

    std::cout << "Done. Output written to: " << output_dir << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
