//! # Test Utilities
//!
//! Scratch directories and small file helpers shared by the filesystem tests.

#ifndef SFG_TESTS_TEST_UTIL_HPP
#define SFG_TESTS_TEST_UTIL_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace sfg::test {

namespace fs = std::filesystem;

/// A unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "sfg_test") {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        std::ostringstream name;
        name << prefix << "_" << stamp << "_" << counter.fetch_add(1);
        path_ = fs::temp_directory_path() / name.str();
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    auto operator=(const TempDir&) -> TempDir& = delete;

    [[nodiscard]] auto path() const -> const fs::path& {
        return path_;
    }

    [[nodiscard]] auto operator/(const std::string& rel) const -> fs::path {
        return path_ / rel;
    }

private:
    fs::path path_;
};

inline void write_text(const fs::path& path, const std::string& text) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

inline auto read_text(const fs::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// Polls `pred` every 10 ms until it holds or `timeout` passes.
template <typename Pred>
auto wait_for(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
    -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// ============================================================================
// Sample Sources
// ============================================================================

inline constexpr const char* USER_SOURCE = R"(import 'package:freezed_annotation/freezed_annotation.dart';

part 'user.freezed.dart';
part 'user.g.dart';

@freezed
class User with _$User {
  const factory User({
    required String name,
    required int age,
    String? email,
    @Default([]) List<String> tags,
  }) = _User;

  factory User.fromJson(Map<String, dynamic> json) => _$UserFromJson(json);
}
)";

inline constexpr const char* PROVIDER_SOURCE = R"(import 'package:riverpod_annotation/riverpod_annotation.dart';

part 'provider.g.dart';

@riverpod
String greeting(GreetingRef ref) => 'Hello';

@riverpod
Future<int> userAge(UserAgeRef ref, String userId) async => 42;

@riverpod
class Counter extends _$Counter {
  @override
  int build() => 0;

  void increment() => state++;
}
)";

inline constexpr const char* PRODUCT_SOURCE = R"(import 'package:json_annotation/json_annotation.dart';

part 'product.g.dart';

enum Category { food, toys }

@JsonSerializable()
class Product {
  final String id;
  @JsonKey(name: 'display_name')
  final String name;
  final double price;
  final Category category;
  final DateTime? createdAt;

  Product({
    required this.id,
    required this.name,
    required this.price,
    required this.category,
    this.createdAt,
  });
}
)";

} // namespace sfg::test

#endif // SFG_TESTS_TEST_UTIL_HPP
