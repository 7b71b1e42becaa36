#pragma once

namespace policy {

/*
 * A SearchHandle is what the playout driver hands to the tree policy on each choose_child() call.
 * It grants access to the calling thread's ThreadData. The handle does not own the data; the
 * driver keeps the ThreadData alive for the duration of the thread's work.
 *
 * Handles are cheap to copy and are passed by value.
 */
template <typename ThreadDataT>
class SearchHandle {
 public:
  using ThreadData = ThreadDataT;

  explicit SearchHandle(ThreadDataT& thread_data) : thread_data_(&thread_data) {}

  ThreadData& thread_data() const { return *thread_data_; }

 private:
  ThreadData* thread_data_;
};

}  // namespace policy
