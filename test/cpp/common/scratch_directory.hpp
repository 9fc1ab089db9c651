#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>

namespace test_support {

//! Temporary directory removed with everything below it on destruction
class ScratchDirectory {
public:
	explicit ScratchDirectory(const std::string &name) {
		static std::atomic<int> counter {0};
		path_ = std::filesystem::temp_directory_path() /
		        ("occupancy_" + name + "_" + std::to_string(std::random_device {}()) + "_" + std::to_string(counter++));
		std::filesystem::remove_all(path_);
		std::filesystem::create_directories(path_);
	}

	~ScratchDirectory() {
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	ScratchDirectory(const ScratchDirectory &) = delete;
	ScratchDirectory &operator=(const ScratchDirectory &) = delete;

	const std::filesystem::path &Path() const {
		return path_;
	}

	std::string File(const std::string &relative) const {
		return (path_ / relative).string();
	}

	//! Writes content to a file below the directory, creating parents
	std::string Write(const std::string &relative, const std::string &content) const {
		const auto target = path_ / relative;
		std::filesystem::create_directories(target.parent_path());
		std::ofstream out(target);
		if (!out) {
			throw std::runtime_error("cannot write " + target.string());
		}
		out << content;
		return target.string();
	}

	std::string Read(const std::string &relative) const {
		std::ifstream in(path_ / relative);
		return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	}

private:
	std::filesystem::path path_;
};

} // namespace test_support
