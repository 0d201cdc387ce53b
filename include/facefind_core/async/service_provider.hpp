#pragma once

#include <memory>

namespace facefind_core {
class ContentCache;
class EmbeddingStore;
class EmbeddingProducer;
class PhotoSource;
namespace async {
class CallSlots;
class WorkQueue;
}
}

namespace facefind_core {

class ServiceProvider {
 public:
  // Without `call_slots`, blocking calls are bounded by the item timeout only.
  ServiceProvider(std::shared_ptr<ContentCache> cache,
                  std::shared_ptr<EmbeddingStore> store,
                  std::shared_ptr<EmbeddingProducer> producer,
                  std::shared_ptr<PhotoSource> source,
                  std::shared_ptr<async::WorkQueue> queue,
                  std::shared_ptr<async::CallSlots> call_slots = nullptr)
      : cache_(cache),
        store_(store),
        producer_(producer),
        source_(source),
        queue_(queue),
        call_slots_(call_slots) {}

  ContentCache& get_content_cache() {
    return *cache_;
  }
  EmbeddingStore& get_embedding_store() {
    return *store_;
  }
  PhotoSource& get_photo_source() {
    return *source_;
  }
  async::WorkQueue& get_work_queue() {
    return *queue_;
  }

  // Shared so a timed-out call can keep its collaborators alive on its own thread
  std::shared_ptr<ContentCache> get_content_cache_ptr() {
    return cache_;
  }
  std::shared_ptr<PhotoSource> get_photo_source_ptr() {
    return source_;
  }
  std::shared_ptr<EmbeddingProducer> get_embedding_producer() {
    return producer_;
  }

  std::shared_ptr<async::CallSlots> get_call_slots() {
    return call_slots_;
  }

 private:
  std::shared_ptr<ContentCache> cache_;
  std::shared_ptr<EmbeddingStore> store_;
  std::shared_ptr<EmbeddingProducer> producer_;
  std::shared_ptr<PhotoSource> source_;
  std::shared_ptr<async::WorkQueue> queue_;
  std::shared_ptr<async::CallSlots> call_slots_;
};

}  // namespace facefind_core
