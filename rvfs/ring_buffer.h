// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef RING_BUFFER_H_7712093845610293847
#define RING_BUFFER_H_7712093845610293847

#include <algorithm>
#include <cassert>
#include <type_traits>
#include <vector>


namespace rvfs
{
//circular buffer for trivially copyable elements, e.g. prefetch buffer of a byte stream
template <class T>
class RingBuffer
{
    static_assert(std::is_trivially_copyable_v<T>);
public:
    RingBuffer() {}

    size_t size    () const { return size_; }
    size_t capacity() const { return buf_.size(); }
    bool   empty   () const { return size_ == 0; }

    void reserve(size_t minCapacity)
    {
        if (minCapacity <= capacity())
            return;

        std::vector<T> newBuf(std::max(minCapacity + minCapacity / 2, minCapacity));
        extractFrontImpl(newBuf.data(), size_, false /*consume*/);
        buf_.swap(newBuf);
        bufStart_ = 0;
    }

    //grows capacity as needed
    template <class Iterator>
    void insert_back(Iterator first, Iterator last)
    {
        const size_t len = last - first;
        reserve(size_ + len);

        const size_t endPos = getBufPos(size_);
        const size_t tailSize = std::min(len, capacity() - endPos);

        std::copy(first, first + tailSize, buf_.begin() + endPos);
        std::copy(first + tailSize, last, buf_.begin());
        size_ += len;
    }

    //contract: last - first <= size()
    template <class Iterator>
    void extract_front(Iterator first, Iterator last)
    {
        const size_t len = last - first;
        assert(size_ >= len);
        extractFrontImpl(first, len, true /*consume*/);
    }


private:
    template <class Iterator>
    void extractFrontImpl(Iterator itTrg, size_t len, bool consume)
    {
        const size_t frontSize = std::min(len, capacity() - bufStart_);

        itTrg = std::copy(buf_.begin() + bufStart_, buf_.begin() + bufStart_ + frontSize, itTrg);
        /**/    std::copy(buf_.begin(), buf_.begin() + (len - frontSize), itTrg);

        if (consume)
        {
            size_ -= len;
            bufStart_ = size_ == 0 ? 0 : getBufPos(len);
        }
    }

    size_t getBufPos(size_t offset) const
    {
        const size_t cap = capacity();
        return cap == 0 ? 0 : (bufStart_ + offset) % cap;
    }

    std::vector<T> buf_;
    size_t bufStart_ = 0;
    size_t size_ = 0;
};
}

#endif //RING_BUFFER_H_7712093845610293847
