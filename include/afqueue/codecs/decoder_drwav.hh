#pragma once

#include <afqueue/sdk/decoder.hh>
#include <afqueue/sdk/types.hh>

#include <memory>

namespace afqueue {
    /*!
     * \brief WAV decoder backed by dr_wav.
     */
    class decoder_drwav : public decoder {
        public:
            decoder_drwav();
            ~decoder_drwav() override;

            /*!
             * \brief Check the stream for WAV data. The stream position is not restored.
             */
            static bool accept(io_stream* rwops);

            [[nodiscard]] const char* get_name() const override;
            void open(io_stream* rwops) override;
            [[nodiscard]] channels_t get_channels() const override;
            [[nodiscard]] sample_rate_t get_rate() const override;
            [[nodiscard]] std::chrono::microseconds duration() const override;
            [[nodiscard]] metadata_t get_metadata() const override;

        protected:
            size_t do_decode(float* buf, size_t len, bool& call_again) override;

        private:
            struct impl;
            std::unique_ptr <impl> m_pimpl;
    };
} // namespace afqueue
