#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

/**
 * @file field3d.hpp
 * @brief Contiguous 3D field container on a staggered LES grid.
 *
 * Storage is row-major with the vertical level as the slowest index and
 * `x` as the fastest, `(k, j, i)`, which is the layout of the host model's
 * restart and boundary files. Includes size checking for allocations and
 * overflow-safe dimension math.
 */

namespace nestinit
{

template<typename TF>
class Field3D
{
public:
    /**
     * @brief Constructs an empty field.
     */
    Field3D() : nz_(0), ny_(0), nx_(0) {}

    /**
     * @brief Constructs a zero-initialized field.
     * @param nz Number of vertical levels.
     * @param ny Number of points in y.
     * @param nx Number of points in x.
     */
    Field3D(int nz, int ny, int nx) : nz_(nz), ny_(ny), nx_(nx)
    {
        data_.resize(checked_size(nz, ny, nx), TF(0));
    }

    /**
     * @brief Constructs a field initialized with a constant value.
     */
    Field3D(int nz, int ny, int nx, TF init_value) : nz_(nz), ny_(ny), nx_(nx)
    {
        data_.resize(checked_size(nz, ny, nx), init_value);
    }

    /**
     * @brief Resizes and zero-initializes field storage.
     */
    void resize(int nz, int ny, int nx)
    {
        const std::size_t new_size = checked_size(nz, ny, nx);
        nz_ = nz;
        ny_ = ny;
        nx_ = nx;
        data_.assign(new_size, TF(0));
    }

    /**
     * @brief Fills all elements with a constant value.
     */
    void fill(TF value) { std::fill(data_.begin(), data_.end(), value); }

    int size_z() const { return nz_; }
    int size_y() const { return ny_; }
    int size_x() const { return nx_; }

    /**
     * @brief Returns total flattened element count.
     */
    std::size_t size() const { return data_.size(); }

    bool empty() const { return data_.empty(); }

    TF* data() { return data_.data(); }
    const TF* data() const { return data_.data(); }

    /**
     * @brief Returns pointer to the first element of level `k`.
     */
    TF* level(int k) { return data_.data() + static_cast<std::size_t>(k) * plane_size(); }
    const TF* level(int k) const { return data_.data() + static_cast<std::size_t>(k) * plane_size(); }

    std::size_t plane_size() const
    {
        return static_cast<std::size_t>(ny_) * static_cast<std::size_t>(nx_);
    }

    TF& operator()(int k, int j, int i) { return data_[flatten_index(k, j, i)]; }
    const TF& operator()(int k, int j, int i) const { return data_[flatten_index(k, j, i)]; }

    const std::vector<TF>& values() const { return data_; }

private:
    std::size_t flatten_index(int k, int j, int i) const
    {
        assert(k >= 0 && k < nz_ && j >= 0 && j < ny_ && i >= 0 && i < nx_);
        // Row-major: idx = k*ny*nx + j*nx + i.
        return static_cast<std::size_t>(k) * plane_size() +
               static_cast<std::size_t>(j) * static_cast<std::size_t>(nx_) +
               static_cast<std::size_t>(i);
    }

    static std::size_t checked_size(int nz, int ny, int nx)
    {
        if (nz < 0 || ny < 0 || nx < 0)
        {
            throw std::invalid_argument("Field3D dimensions must be non-negative");
        }

        const std::size_t nz_sz = static_cast<std::size_t>(nz);
        const std::size_t ny_sz = static_cast<std::size_t>(ny);
        const std::size_t nx_sz = static_cast<std::size_t>(nx);

        if (ny_sz != 0 && nx_sz > std::numeric_limits<std::size_t>::max() / ny_sz)
        {
            throw std::overflow_error("Field3D size overflow on ny*nx");
        }

        const std::size_t plane = ny_sz * nx_sz;
        if (plane != 0 && nz_sz > std::numeric_limits<std::size_t>::max() / plane)
        {
            throw std::overflow_error("Field3D size overflow on nz*ny*nx");
        }

        return plane * nz_sz;
    }

    int nz_;
    int ny_;
    int nx_;
    std::vector<TF> data_;
};

} // namespace nestinit
