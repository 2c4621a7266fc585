#ifndef DAE_CORE_MODELHANDLE_H
#define DAE_CORE_MODELHANDLE_H

#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace dae::core {

/**
 * @brief Owned, lazily-initialized handle to an expensive resource (model files,
 *        loaded weights, resolved tool paths).
 *
 * The loader runs at most once, on the first get(), guarded by std::call_once.
 * A loader that throws leaves the handle in a failed state and every later
 * get() reports the same failure without retrying.
 */
template<typename T>
class ModelHandle {
public:
    using Loader = std::function<std::shared_ptr<const T>()>;

    explicit ModelHandle(Loader loader) : m_loader(std::move(loader)) {}

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    /**
     * @brief Returns the loaded resource, loading it on first use.
     * @return The resource, or nullptr if loading failed.
     */
    std::shared_ptr<const T> get() const {
        std::call_once(m_once, [this]() {
            try {
                m_value = m_loader ? m_loader() : nullptr;
                if (!m_value) m_error = "loader produced no value";
            } catch (const std::exception& e) {
                m_error = e.what();
            }
        });
        return m_value;
    }

    /**
     * @brief Load error message; empty until get() has run or on success.
     */
    const std::string& error() const { return m_error; }

private:
    Loader m_loader;
    mutable std::once_flag m_once;
    mutable std::shared_ptr<const T> m_value;
    mutable std::string m_error;
};

} // namespace dae::core

#endif // DAE_CORE_MODELHANDLE_H
