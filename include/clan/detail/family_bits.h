#ifndef CLAN_DETAIL_FAMILY_BITS_H
#define CLAN_DETAIL_FAMILY_BITS_H

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace clan::detail {

// A growable bitset addressed by family index. Bits past the end read as cleared,
// so an entity never has to know how many families exist.
class family_bits {
	using word = std::uint64_t;
	static constexpr std::size_t bits_per_word = 64;

	std::vector<word> words;

public:
	[[nodiscard]] bool test(std::size_t index) const noexcept {
		std::size_t const w = index / bits_per_word;
		if (w >= words.size())
			return false;
		return (words[w] & mask_of(index)) != 0;
	}

	void set(std::size_t index) {
		std::size_t const w = index / bits_per_word;
		if (w >= words.size())
			words.resize(w + 1, word{0});
		words[w] |= mask_of(index);
	}

	void reset(std::size_t index) noexcept {
		std::size_t const w = index / bits_per_word;
		if (w < words.size())
			words[w] &= ~mask_of(index);
	}

	// Clears every bit
	void reset() noexcept {
		std::ranges::fill(words, word{0});
	}

	[[nodiscard]] bool none() const noexcept {
		return std::ranges::all_of(words, [](word w) { return w == 0; });
	}

	// The number of set bits
	[[nodiscard]] std::size_t count() const noexcept {
		std::size_t total = 0;
		for (word const w : words)
			total += static_cast<std::size_t>(std::popcount(w));
		return total;
	}

private:
	static constexpr word mask_of(std::size_t index) noexcept {
		return word{1} << (index % bits_per_word);
	}
};

} // namespace clan::detail

#endif // !CLAN_DETAIL_FAMILY_BITS_H
