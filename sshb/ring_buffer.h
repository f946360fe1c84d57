// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RING_BUFFER_H_9014426735108822
#define RING_BUFFER_H_9014426735108822

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>


namespace sshb
{
//FIFO queue: circular buffer with std::vector<>-like exponential growth
template <class T>
class RingBuffer
{
public:
    RingBuffer() {}

    RingBuffer(RingBuffer&& tmp) noexcept : rawMem_(std::move(tmp.rawMem_)), capacity_(tmp.capacity_), bufStart_(tmp.bufStart_), size_(tmp.size_)
    {
        tmp.capacity_ = tmp.bufStart_ = tmp.size_ = 0;
    }
    RingBuffer& operator=(RingBuffer&& tmp) noexcept { swap(tmp); return *this; }

    ~RingBuffer() { clear(); }

    size_t size () const { return size_; }
    bool   empty() const { return size_ == 0; }

    T&       front()       { assert(!empty()); return getBufPtr()[bufStart_]; }
    const T& front() const { assert(!empty()); return getBufPtr()[bufStart_]; }

    template <class U>
    void push_back(U&& value)
    {
        reserve(size_ + 1); //throw std::bad_alloc
        ::new (getBufPtr() + getBufPos(size_)) T(std::forward<U>(value)); //throw ?
        ++size_;
    }

    void pop_front()
    {
        front().~T();
        --size_;

        if (size_ == 0)
            bufStart_ = 0;
        else
            bufStart_ = getBufPos(1);
    }

    void clear()
    {
        const size_t frontSize = std::min(size_, capacity_ - bufStart_);

        std::destroy(getBufPtr() + bufStart_, getBufPtr() + bufStart_ + frontSize);
        std::destroy(getBufPtr(), getBufPtr() + size_ - frontSize);
        bufStart_ = size_ = 0;
    }

    void swap(RingBuffer& other)
    {
        std::swap(rawMem_,   other.rawMem_);
        std::swap(capacity_, other.capacity_);
        std::swap(bufStart_, other.bufStart_);
        std::swap(size_,     other.size_);
    }

    void reserve(size_t minCapacity) //throw std::bad_alloc
    {
        static_assert(std::is_nothrow_move_constructible_v<T>);

        if (minCapacity > capacity_)
        {
            const size_t newCapacity = std::max<size_t>(minCapacity + minCapacity / 2, 4);

            RingBuffer newBuf(newCapacity); //throw std::bad_alloc

            const size_t frontSize = std::min(size_, capacity_ - bufStart_);

            T* itTrg = std::uninitialized_move(getBufPtr() + bufStart_, getBufPtr() + bufStart_ + frontSize, newBuf.getBufPtr());
            /**/       std::uninitialized_move(getBufPtr(), getBufPtr() + size_ - frontSize, itTrg);
            newBuf.size_ = size_;

            clear(); //destroy moved-from elements
            newBuf.swap(*this);
        }
    }

private:
    RingBuffer           (const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    explicit RingBuffer(size_t capacity) :
        rawMem_(static_cast<std::byte*>(::operator new (capacity * sizeof(T)))), //throw std::bad_alloc
        capacity_(capacity) {}

    /**/  T* getBufPtr()       { return reinterpret_cast<T*>(rawMem_.get()); }
    const T* getBufPtr() const { return reinterpret_cast<const T*>(rawMem_.get()); }

    size_t getBufPos(size_t offset) const
    {
        size_t bufPos = bufStart_ + offset;
        if (bufPos >= capacity_)
            bufPos -= capacity_;
        return bufPos;
    }

    struct FreeStoreDelete { void operator()(std::byte* p) const { ::operator delete (p); } };

    std::unique_ptr<std::byte, FreeStoreDelete> rawMem_;
    size_t capacity_  = 0; //as number of T
    size_t bufStart_  = 0; //<  capacity_
    size_t size_      = 0; //<= capacity_
};
}

#endif //RING_BUFFER_H_9014426735108822
