/*
 * StreamStudio HumanDetection Library
 * Copyright (C) 2026 The StreamStudio Authors
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ScratchSurface.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace StreamStudio::HumanDetection {

ScratchSurface::Lease::~Lease() noexcept
{
	if (owner_) {
		owner_->leased_ = false;
	}
}

ScratchSurface::Lease::Lease(Lease &&other) noexcept
	: owner_(other.owner_),
	  width_(other.width_),
	  height_(other.height_)
{
	other.owner_ = nullptr;
}

std::uint8_t *ScratchSurface::Lease::data() const noexcept
{
	return owner_ ? owner_->storage_.get() : nullptr;
}

void ScratchSurface::Lease::write(const BgraImageView &image)
{
	if (!owner_) {
		throw std::logic_error("write on a moved-from ScratchSurface::Lease");
	}
	if (image.width != width_ || image.height != height_) {
		throw std::invalid_argument("image is " + std::to_string(image.width) + "x" +
					    std::to_string(image.height) + " but the lease is " +
					    std::to_string(width_) + "x" + std::to_string(height_));
	}

	const std::size_t rowBytes = width_ * kBytesPerPixel;
	const std::size_t srcStride = image.getStride();
	std::uint8_t *dst = data();

	if (srcStride == rowBytes) {
		std::memcpy(dst, image.data, rowBytes * height_);
		return;
	}

	for (std::size_t y = 0; y < height_; y++) {
		std::memcpy(dst + y * rowBytes, image.data + y * srcStride, rowBytes);
	}
}

BgraImageView ScratchSurface::Lease::view() const noexcept
{
	return BgraImageView{data(), width_, height_, width_ * kBytesPerPixel};
}

ScratchSurface::Lease ScratchSurface::acquire(std::size_t width, std::size_t height)
{
	if (leased_) {
		throw std::logic_error("ScratchSurface is already leased");
	}
	if (width == 0 || height == 0) {
		throw std::invalid_argument("ScratchSurface dimensions must be non-zero");
	}

	const std::size_t required = width * height * kBytesPerPixel;
	if (required > capacity_) {
		storage_ = Storage(new (std::align_val_t(kAlignment)) std::uint8_t[required]);
		capacity_ = required;
	}

	leased_ = true;
	return Lease(this, width, height);
}

void ScratchSurface::release() noexcept
{
	storage_.reset();
	capacity_ = 0;
}

} // namespace StreamStudio::HumanDetection
