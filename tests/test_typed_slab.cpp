#include "tests.hpp"

#include <stdexcept>

#include "tslab/keys/index_key.hpp"
#include "tslab/slab/typed_slab.hpp"

namespace {

	struct node_tag;
	struct tiny_tag;

	using node_key = tslab::keys::index_key<node_tag>;
	using tiny_key = tslab::keys::index_key<tiny_tag, std::uint8_t>;

	template <typename V>
	using node_slab = tslab::slab::typed_slab<node_key, V>;

	struct tree_node {
		node_key self;
		node_key parent;
		std::vector<node_key> children;
	};

	std::size_t raw(node_key k) {
		return tslab::keys::key_traits<node_key>::to_index(k);
	}
}

TEST_SUITE("slab/typed_slab") {

	TEST_CASE("insert then get returns the value") {
		node_slab<std::string> slab;
		auto a = slab.insert("alpha");
		auto b = slab.insert("beta");
		REQUIRE(slab.get(a) != nullptr);
		REQUIRE(slab.get(b) != nullptr);
		CHECK_EQ(*slab.get(a), "alpha");
		CHECK_EQ(*slab.get(b), "beta");
		CHECK_EQ(slab.len(), 2u);
		CHECK_FALSE(slab.is_empty());
	}

	TEST_CASE("removed slot is reused before appending") {
		node_slab<int> slab;
		auto k0 = slab.insert(10);
		auto k1 = slab.insert(20);
		auto k2 = slab.insert(30);
		CHECK_EQ(raw(k0), 0u);
		CHECK_EQ(raw(k1), 1u);
		CHECK_EQ(raw(k2), 2u);

		auto removed = slab.remove(k1);
		REQUIRE(removed.has_value());
		CHECK_EQ(*removed, 20);
		CHECK(slab.get(k1) == nullptr);
		CHECK_EQ(slab.len(), 2u);

		auto reused = slab.insert(40);
		CHECK_EQ(raw(reused), 1u);

		std::vector<std::pair<node_key, int>> got;
		for (auto [k, v] : slab.iter()) {
			got.emplace_back(k, v);
		}
		std::vector<std::pair<node_key, int>> expected{ { k0, 10 }, { reused, 40 }, { k2, 30 } };
		CHECK(got == expected);
	}

	TEST_CASE("absent keys") {
		node_slab<int> slab;
		CHECK(slab.get(node_key{ 0 }) == nullptr);
		CHECK(slab.get_mut(node_key{ 5 }) == nullptr);
		CHECK_FALSE(slab.remove(node_key{ 3 }).has_value());
		CHECK_FALSE(slab.contains(node_key{ 0 }));

		auto k = slab.insert(1);
		REQUIRE(slab.remove(k).has_value());
		CHECK(slab.get(k) == nullptr);
		CHECK(slab.get_mut(k) == nullptr);
		CHECK_FALSE(slab.remove(k).has_value());
		CHECK_THROWS_AS(slab.at(k), std::out_of_range);
	}

	TEST_CASE("stale key aliases a reused slot") {
		node_slab<int> slab;
		auto old_key = slab.insert(1);
		slab.remove(old_key);
		auto new_key = slab.insert(2);
		CHECK(old_key == new_key);
		REQUIRE(slab.get(old_key) != nullptr);
		CHECK_EQ(*slab.get(old_key), 2);
	}

	TEST_CASE("get_mut, at and operator[] write through") {
		node_slab<std::string> slab;
		auto k = slab.insert("a");
		*slab.get_mut(k) += "b";
		slab.at(k) += "c";
		slab[k] += "d";
		CHECK_EQ(std::as_const(slab)[k], "abcd");
		CHECK_EQ(std::as_const(slab).at(k), "abcd");
	}

	TEST_CASE("insert_entry lets the value learn its key") {
		node_slab<tree_node> slab;
		auto [root_key, root] = slab.insert_entry(tree_node{});
		root.self = root_key;

		auto [child_key, child] = slab.insert_entry(tree_node{});
		child.self = child_key;
		child.parent = root_key;
		slab.get_mut(root_key)->children.push_back(child_key);

		CHECK_EQ(slab.at(root_key).self, root_key);
		CHECK_EQ(slab.at(child_key).parent, root_key);
		REQUIRE_EQ(slab.at(root_key).children.size(), 1u);
		CHECK_EQ(slab.at(root_key).children.front(), child_key);
	}

	TEST_CASE("vacant_key predicts the next insert") {
		node_slab<int> slab;
		CHECK_EQ(slab.vacant_key(), node_key{ 0 });
		slab.insert(1);
		auto k = slab.insert(2);
		slab.insert(3);
		slab.remove(k);
		auto predicted = slab.vacant_key();
		CHECK_EQ(predicted, k);
		CHECK_EQ(slab.insert(4), predicted);
		CHECK_EQ(slab.vacant_key(), node_key{ 3 });
	}

	TEST_CASE("emplace") {
		node_slab<std::string> slab;
		auto k = slab.emplace(3, 'x');
		CHECK_EQ(slab.at(k), "xxx");
		auto [k2, v2] = slab.emplace_entry("yy");
		CHECK_EQ(v2, "yy");
		CHECK_EQ(raw(k2), 1u);
	}

	TEST_CASE("move-only values") {
		node_slab<std::unique_ptr<int>> slab;
		auto a = slab.insert(std::make_unique<int>(1));
		auto b = slab.emplace(new int(2));
		auto taken = slab.remove(a);
		REQUIRE(taken.has_value());
		REQUIRE(taken->get() != nullptr);
		CHECK_EQ(**taken, 1);
		CHECK_EQ(*slab.at(b), 2);
	}

	TEST_CASE("key space exhaustion throws and leaves the slab intact") {
		tslab::slab::typed_slab<tiny_key, int> slab;
		for (int i = 0; i < 255; ++i) {
			auto k = slab.insert(i);
			CHECK_EQ(static_cast<int>(k.get()), i);
		}
		CHECK_EQ(slab.len(), 255u);
		CHECK_THROWS_AS(slab.insert(255), std::length_error);
		CHECK_THROWS_AS(slab.vacant_key(), std::length_error);
		CHECK_EQ(slab.len(), 255u);

		REQUIRE(slab.remove(tiny_key{ 7 }).has_value());
		auto k = slab.insert(1000);
		CHECK_EQ(k, tiny_key{ 7 });
		CHECK_EQ(slab.at(k), 1000);
	}

	TEST_CASE("plain integer keys") {
		tslab::slab::typed_slab<std::uint16_t, char> slab;
		auto a = slab.insert('a');
		auto b = slab.insert('b');
		CHECK_EQ(a, 0);
		CHECK_EQ(b, 1);
		CHECK_EQ(slab.at(b), 'b');
	}

	TEST_CASE("capacity management") {
		auto slab = node_slab<int>::with_capacity(32);
		CHECK(slab.capacity() >= 32);
		CHECK(slab.is_empty());
		slab.reserve(64);
		CHECK(slab.capacity() >= 64);

		for (int i = 0; i < 10; ++i) {
			slab.insert(i);
		}
		const auto cap = slab.capacity();
		slab.clear();
		CHECK(slab.is_empty());
		CHECK_EQ(slab.size(), 0u);
		CHECK_EQ(slab.capacity(), cap);
		CHECK_EQ(raw(slab.insert(1)), 0u);
	}

	TEST_CASE("copies are independent") {
		node_slab<std::string> slab;
		auto k = slab.insert("one");
		auto copy = slab;
		slab.at(k) = "changed";
		slab.insert("two");
		CHECK_EQ(copy.at(k), "one");
		CHECK_EQ(copy.len(), 1u);
		CHECK_EQ(slab.len(), 2u);
	}

	TEST_CASE("stats are forwarded") {
		tslab::slab::typed_slab<node_key, int, tslab::slab::stats> slab;
		auto k0 = slab.insert(1);
		slab.insert(2);
		slab.insert(3);
		slab.remove(k0);
		CHECK(slab.get(k0) == nullptr);
		slab.insert(4);
		CHECK_FALSE(slab.remove(node_key{ 99 }).has_value());
		for (auto v : slab.drain()) {
			static_cast<void>(v);
		}
		const auto& st = slab.get_stats();
		CHECK_EQ(st.inserts, 4u);
		CHECK_EQ(st.appended_slots, 3u);
		CHECK_EQ(st.reused_slots, 1u);
		CHECK_EQ(st.removes, 1u);
		CHECK_EQ(st.failed_lookups, 2u);
		CHECK_EQ(st.drained, 3u);
	}

	TEST_CASE("length tracks successful inserts minus removes") {
		node_slab<int> slab;
		std::map<node_key, int> model;
		std::mt19937 rng{ 1234 };
		std::uniform_int_distribution<int> op(0, 9);
		std::size_t inserts = 0;
		std::size_t removes = 0;

		for (int step = 0; step < 4000; ++step) {
			const auto roll = op(rng);
			if (roll < 6 || model.empty()) {
				auto k = slab.insert(step);
				model[k] = step;
				++inserts;
			}
			else if (roll < 9) {
				std::uniform_int_distribution<std::size_t> pick(0, model.size() - 1);
				auto it = std::next(model.begin(), static_cast<std::ptrdiff_t>(pick(rng)));
				auto removed = slab.remove(it->first);
				REQUIRE(removed.has_value());
				CHECK_EQ(*removed, it->second);
				model.erase(it);
				++removes;
			}
			else {
				// key that was never handed out
				CHECK_FALSE(slab.remove(node_key{ 1'000'000 }).has_value());
			}
			REQUIRE_EQ(slab.len(), inserts - removes);
			REQUIRE_EQ(slab.len(), model.size());
		}

		std::vector<std::pair<node_key, int>> got;
		for (auto [k, v] : slab.iter()) {
			got.emplace_back(k, v);
		}
		std::vector<std::pair<node_key, int>> expected(model.begin(), model.end());
		CHECK(got == expected);
	}
}
