#ifndef SECBUF_MEMORY_H
#define SECBUF_MEMORY_H

/**
 * secbuf memory subsystem
 *
 * Secure byte buffers and the pools that recycle them:
 *
 * - SecureBytes and WipePolicy: owned regions wiped before reuse
 * - LinearBuffer: cursor-based reader/writer with string framing
 * - RingBuffer: lazily allocated streaming buffer
 * - BufferPool / FastBufferPool: recycling of LinearBuffers
 * - ConnectionBufferSet: per-connection buffer lifecycle
 *
 * Usage:
 *   #include <secbuf/memory.h>
 *
 *   using namespace secbuf::memory;
 *
 *   auto pool = std::make_shared<BufferPool>(pool_presets::network_mtu());
 *   {
 *       auto buffer = pool->acquire_pooled();
 *       buffer->put_u32(42);
 *       // Burned and returned to the pool on scope exit
 *   }
 *
 *   ConnectionBufferSet connection(connection_presets::standard(), pool);
 *   connection.init_read_buf(1500);
 */

#include <secbuf/memory/secure_bytes.h>
#include <secbuf/memory/buffer.h>
#include <secbuf/memory/ring_buffer.h>
#include <secbuf/memory/pool.h>
#include <secbuf/memory/fast_pool.h>
#include <secbuf/memory/connection_buffers.h>

#endif // SECBUF_MEMORY_H
