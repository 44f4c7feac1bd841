#include "graph_arena.hpp"
#include "slab_shell.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <iostream>
#include <string>
#include <vector>

namespace {
	using namespace tslab_demo;

	constexpr std::size_t DEFAULT_CAPACITY = 16;

	int cmd_run(std::size_t capacity, const std::vector<std::string>& commands) {
		slab_shell shell(std::cout, std::cerr, capacity);
		int failed = 0;
		for (const auto& line : commands) {
			std::cout << "> " << line << "\n";
			if (!shell.execute(line)) {
				++failed;
			}
		}
		return failed == 0 ? 0 : 1;
	}

	void print_graph(const graph_arena& graph) {
		for (const auto& [key, n] : graph.nodes().iter()) {
			std::cout << "  node " << key.get() << " '" << n.name << "' ->";
			for (auto to : graph.neighbours(key)) {
				std::cout << " " << graph.find(to)->name;
			}
			std::cout << " (weight " << graph.out_weight(key) << ")\n";
		}
	}

	int cmd_graph() {
		try {
			graph_arena graph;
			auto a = graph.add_node("a");
			auto b = graph.add_node("b");
			auto c = graph.add_node("c");
			auto d = graph.add_node("d");

			graph.connect(a, b, 1.5);
			graph.connect(a, c, 2.0);
			graph.connect(b, d, 0.5);
			graph.connect(c, d, 1.0);
			graph.connect(d, a, 3.0);

			std::cout << "Graph: " << graph.node_count() << " nodes, " << graph.edge_count() << " edges\n";
			print_graph(graph);

			graph.remove_node(c);
			std::cout << "After removing 'c': " << graph.node_count() << " nodes, " << graph.edge_count() << " edges\n";
			print_graph(graph);

			auto e = graph.add_node("e");
			std::cout << "Node 'e' reuses slot " << e.get() << "\n";
			graph.connect(e, a, 0.25);
			print_graph(graph);

			std::cout << "Nodes from last to first:";
			auto nodes = graph.nodes().iter();
			for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
				std::cout << " " << (*it).second.name;
			}
			std::cout << "\n";

			auto taken = graph.take_nodes();
			std::cout << "Drained " << taken.size() << " nodes, arena empty: "
				<< (graph.nodes().is_empty() ? "yes" : "no") << "\n";
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error building graph: " << e.what() << "\n";
			return 1;
		}
	}
}

void shell_mode(std::size_t capacity) {
	replxx::Replxx rx;
	rx.set_max_history_size(128);

	slab_shell shell(std::cout, std::cerr, capacity);

	std::cout << "tslab shell\n";
	std::cout << "Type 'help' for commands, 'exit' to quit\n\n";

	while (true) {
		const char* input = rx.input("tslab> ");
		if (!input) break;

		std::string line(input);
		if (line.empty()) continue;
		if (line == "exit" || line == "quit") break;

		shell.execute(line);
		rx.history_add(line);
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "tslab - typed slab playground" };

	std::size_t capacity = DEFAULT_CAPACITY;
	app.add_option("-c,--capacity", capacity, "Slots to reserve up front")->default_val(DEFAULT_CAPACITY);

	app.require_subcommand(1);

	auto shell_cmd = app.add_subcommand("shell", "Interactive shell over a string slab");
	shell_cmd->callback([&]() {
		shell_mode(capacity);
		});

	std::vector<std::string> commands;
	int run_result = 0;
	auto run_cmd = app.add_subcommand("run", "Execute shell commands given as arguments");
	run_cmd->add_option("commands", commands, "Commands, one per argument")->required();
	run_cmd->callback([&]() {
		run_result = cmd_run(capacity, commands);
		});

	int graph_result = 0;
	auto graph_cmd = app.add_subcommand("graph", "Build and edit a small graph kept in two arenas");
	graph_cmd->callback([&]() {
		graph_result = cmd_graph();
		});

	CLI11_PARSE(app, argc, argv);

	return run_result != 0 ? run_result : graph_result;
}
