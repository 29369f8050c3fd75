#pragma once

#include "progress_session.hpp"
#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

namespace liveline {
namespace progress {

template<typename Sequence>
class ProgressIterable {
    using Container = std::remove_reference_t<Sequence>;
    using InnerIterator = decltype(std::begin(std::declval<Container&>()));

public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename std::iterator_traits<InnerIterator>::value_type;
        using difference_type = typename std::iterator_traits<InnerIterator>::difference_type;
        using pointer = typename std::iterator_traits<InnerIterator>::pointer;
        using reference = typename std::iterator_traits<InnerIterator>::reference;
        
        iterator(ProgressIterable* owner, InnerIterator it, size_t index)
            : owner_(owner), it_(it), index_(index) {}
        
        reference operator*() const { return *it_; }
        
        iterator& operator++() {
            ++it_;
            ++index_;
            owner_->arrive(it_, index_);
            return *this;
        }
        
        bool operator==(const iterator& other) const { return it_ == other.it_; }
        bool operator!=(const iterator& other) const { return it_ != other.it_; }
    
    private:
        ProgressIterable* owner_;
        InnerIterator it_;
        size_t index_;
    };
    
    ProgressIterable(ProgressSession& session, Sequence&& sequence)
        : session_(session),
          sequence_(std::forward<Sequence>(sequence)) {
        auto count = std::distance(std::begin(sequence_), std::end(sequence_));
        if (count > 0) {
            session_.setMaxValue(static_cast<double>(count));
        }
    }
    
    ~ProgressIterable() {
        finish();
    }
    
    ProgressIterable(const ProgressIterable&) = delete;
    ProgressIterable& operator=(const ProgressIterable&) = delete;
    
    iterator begin() {
        if (consumed_) {
            return end();
        }
        consumed_ = true;
        started_ = true;
        session_.start();
        
        auto it = std::begin(sequence_);
        arrive(it, 0);
        return iterator(this, it, 0);
    }
    
    iterator end() {
        return iterator(this, std::end(sequence_), 0);
    }

private:
    ProgressSession& session_;
    Sequence sequence_;
    bool consumed_ = false;
    bool started_ = false;
    bool stopped_ = false;
    
    void arrive(const InnerIterator& it, size_t index) {
        if (it == std::end(sequence_)) {
            finish();
        } else if (session_.isRunning()) {
            session_.advance(static_cast<double>(index));
        }
    }
    
    void finish() {
        if (started_ && !stopped_) {
            stopped_ = true;
            session_.stop();
        }
    }
};

template<typename Sequence>
ProgressIterable<Sequence> iterate(ProgressSession& session, Sequence&& sequence) {
    return ProgressIterable<Sequence>(session, std::forward<Sequence>(sequence));
}

}}
