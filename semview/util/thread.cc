// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "semview/util/thread.h"

#include "semview/base/logging.h"

namespace semview {

void *Thread::ThreadMain(void *arg) {
  Thread *thread = static_cast<Thread *>(arg);
  thread->Run();
  return nullptr;
}

Thread::Thread() : running_(false) {}
Thread::~Thread() {}

void Thread::Start() {
  CHECK(!running_);
  int rc = pthread_create(&thread_, nullptr, &ThreadMain, this);
  CHECK_EQ(rc, 0) << "Unable to create thread";
  running_ = true;

  // Detach the thread if it is not joinable.
  if (!joinable_) {
    pthread_detach(thread_);
  }
}

void Thread::Join() {
  if (!running_) return;
  CHECK(joinable_);

  void *unused;
  pthread_join(thread_, &unused);
  running_ = false;
}

void Thread::SetJoinable(bool joinable) {
  CHECK(!running_) << "Can't SetJoinable() on a running thread";
  joinable_ = joinable;
}

bool Thread::IsSelf() const {
  return pthread_equal(thread_, pthread_self());
}

void ClosureThread::Run() {
  closure_();
}

}  // namespace semview
