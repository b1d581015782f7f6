#pragma once

// tiny self-registering test harness: TEST(name) { ASSERT_...; }

#include <string>
#include <vector>
#include <cstdlib>
#include <utility>
#include <iostream>
#include <stdexcept>
#include <functional>
#include <string_view>

#include "fmt/core.h"

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
	Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

struct AssertionError: public std::runtime_error { using std::runtime_error::runtime_error; };

[[noreturn]] inline void fail(const char* kind, const char* expr, const char* file, int line) {
	throw AssertionError(fmt::format("{}:{}: {} failed: {}", file, line, kind, expr));
}

// runs every registered test whose name contains filter
inline int run_all(std::string_view filter = {}) {
	const char* json_env = std::getenv("DEEPGREP_TEST_JSON");
	const bool json = json_env && (*json_env == '1' || *json_env == 't' || *json_env == 'T' || *json_env == 'y' || *json_env == 'Y');

	auto escape = [](std::string_view s) {
		std::string out;
		for(const char c: s) {
			if(c == '"' || c == '\\') { out += '\\'; out += c; }
			else if(c == '\n') out += "\\n";
			else out += c;
		}
		return out;
	};

	int failed = 0, passed = 0;
	for(auto& t: registry()) {
		if(!filter.empty() && t.name.find(filter) == std::string::npos) continue;
		try {
			t.fn();
			++passed;
			if(json) fmt::print("{{\"event\":\"test\",\"name\":\"{}\",\"status\":\"pass\"}}\n", t.name);
			else fmt::print("[PASS] {}\n", t.name);
		}catch(const std::exception& e) {
			++failed;
			if(json) fmt::print("{{\"event\":\"test\",\"name\":\"{}\",\"status\":\"fail\",\"error\":\"{}\"}}\n", t.name, escape(e.what()));
			else fmt::print(stderr, "[FAIL] {}: {}\n", t.name, e.what());
		}
	}
	if(json) fmt::print("{{\"event\":\"summary\",\"passed\":{},\"failed\":{}}}\n", passed, failed);
	else fmt::print("\n{} passed, {} failed\n", passed, failed);
	return failed == 0 ? 0 : 1;
}

} // namespace mini

#define TEST(name) \
	static void name(); \
	static ::mini::Registrar name##_registrar{#name, name}; \
	static void name()

#define ASSERT_TRUE(expr) do { if(!(expr)) ::mini::fail("ASSERT_TRUE", #expr, __FILE__, __LINE__); } while(0)
#define ASSERT_FALSE(expr) do { if(expr) ::mini::fail("ASSERT_FALSE", #expr, __FILE__, __LINE__); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) ::mini::fail("ASSERT_EQ", #a " == " #b, __FILE__, __LINE__); } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) ::mini::fail("ASSERT_NE", #a " != " #b, __FILE__, __LINE__); } while(0)
