/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>

#include "ImageTypes.hpp"

namespace StreamStudio::HumanDetection {

/**
 * @class ScratchSurface
 * @brief A reusable, aligned BGRA staging buffer owned by one service instance.
 *
 * The storage is allocated on the first acquire() and grows only when a
 * larger image arrives; otherwise it is reused across calls. Access goes
 * through a Lease which gives the surface back when it goes out of scope,
 * including during stack unwinding.
 *
 * @warning Not thread-safe. The owner serializes acquire() calls.
 */
class ScratchSurface {
	struct AlignedDeleter {
		void operator()(std::uint8_t *ptr) const noexcept { ::operator delete[](ptr, std::align_val_t(kAlignment)); }
	};

	using Storage = std::unique_ptr<std::uint8_t[], AlignedDeleter>;

public:
	constexpr static std::size_t kAlignment = 32;
	constexpr static std::size_t kBytesPerPixel = 4;

	/**
	 * @brief Scoped exclusive access to the surface, sized for one image.
	 */
	class Lease {
	public:
		~Lease() noexcept;

		Lease(Lease &&other) noexcept;
		Lease &operator=(Lease &&) = delete;
		Lease(const Lease &) = delete;
		Lease &operator=(const Lease &) = delete;

		std::uint8_t *data() const noexcept;
		std::size_t getWidth() const noexcept { return width_; }
		std::size_t getHeight() const noexcept { return height_; }

		/**
		 * @brief Copies the image into the surface. Dimensions must match the lease.
		 */
		void write(const BgraImageView &image);

		BgraImageView view() const noexcept;

	private:
		friend class ScratchSurface;

		Lease(ScratchSurface *owner, std::size_t width, std::size_t height) noexcept
			: owner_(owner),
			  width_(width),
			  height_(height)
		{
		}

		ScratchSurface *owner_;
		std::size_t width_;
		std::size_t height_;
	};

	ScratchSurface() noexcept = default;
	~ScratchSurface() noexcept = default;

	ScratchSurface(const ScratchSurface &) = delete;
	ScratchSurface &operator=(const ScratchSurface &) = delete;
	ScratchSurface(ScratchSurface &&) = delete;
	ScratchSurface &operator=(ScratchSurface &&) = delete;

	/**
	 * @throw std::logic_error If a lease is already outstanding.
	 * @throw std::invalid_argument If width or height is zero.
	 */
	Lease acquire(std::size_t width, std::size_t height);

	/**
	 * @brief Frees the storage. Must not be called while a lease is outstanding.
	 */
	void release() noexcept;

	bool isLeased() const noexcept { return leased_; }
	std::size_t getCapacity() const noexcept { return capacity_; }

private:
	Storage storage_;
	std::size_t capacity_ = 0;
	bool leased_ = false;
};

} // namespace StreamStudio::HumanDetection
