// Topmost, click-through subtitle strip: D3D11 swap chain + DirectComposition + Direct2D text
#include "Subtitler/Overlay.h"
#include <windows.h>
#include <d3d11.h>
#include <dxgi1_2.h>
#include <dcomp.h>
#include <d2d1_1.h>
#include <d2d1helper.h>
#include <dwrite.h>
#include <wrl/client.h>
#include <string>
#include <atomic>
#include <thread>
#include <mutex>

using Microsoft::WRL::ComPtr;

namespace Subtitler {

namespace {

constexpr int kOverlayWidth = 800;
constexpr int kOverlayHeight = 100;

LRESULT CALLBACK SubtitleWndProc(HWND hWnd, UINT msg, WPARAM wParam, LPARAM lParam){
    switch(msg){
        case WM_NCHITTEST: return HTTRANSPARENT;
        case WM_ERASEBKGND: return 1;
        default: return DefWindowProc(hWnd, msg, wParam, lParam);
    }
}

std::wstring Utf8ToW(const std::string& s){
    if (s.empty()) return {};
    int need = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), -1, nullptr, 0);
    if (need <= 0) return {};
    std::wstring w; w.resize(need - 1);
    MultiByteToWideChar(CP_UTF8, 0, s.c_str(), -1, w.data(), need - 1);
    return w;
}

}

class OverlayWindow : public ISubtitleOverlay {
public:
    explicit OverlayWindow(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

    bool Initialize(const OverlayStyle& style) override {
        HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
        if (FAILED(hr) && hr != RPC_E_CHANGED_MODE){
            if (logger_) logger_->error("CoInitializeEx failed: 0x{:08X}", static_cast<unsigned>(hr));
            return false;
        }
        com_ = SUCCEEDED(hr);
        {
            std::lock_guard<std::mutex> lk(mu_);
            style_ = style;
            styleDirty_ = true;
        }
        WNDCLASSW wc{}; wc.lpszClassName = L"SubtitlerOverlay"; wc.lpfnWndProc = SubtitleWndProc; wc.hInstance = GetModuleHandleW(nullptr);
        if (!RegisterClassW(&wc) && GetLastError() != ERROR_CLASS_ALREADY_EXISTS) return false;
        int sx = GetSystemMetrics(SM_CXSCREEN);
        int sy = GetSystemMetrics(SM_CYSCREEN);
        int x = (sx - kOverlayWidth) / 2; int y = sy - kOverlayHeight - 60;
        hwnd_ = CreateWindowExW(WS_EX_TOPMOST|WS_EX_TRANSPARENT|WS_EX_NOACTIVATE|WS_EX_TOOLWINDOW,
            L"SubtitlerOverlay", L"Subtitles", WS_POPUP, x, y, kOverlayWidth, kOverlayHeight,
            nullptr, nullptr, GetModuleHandleW(nullptr), nullptr);
        if (!hwnd_){
            if (logger_) logger_->error("Overlay window creation failed: {}", GetLastError());
            return false;
        }
        if (!initD3D() || !initComposition()){
            if (logger_) logger_->error("Overlay graphics initialization failed");
            return false;
        }
        if (logger_) logger_->info("Subtitle overlay initialized ({}x{})", kOverlayWidth, kOverlayHeight);
        return true;
    }

    void ApplyStyle(const OverlayStyle& style) override {
        std::lock_guard<std::mutex> lk(mu_);
        style_ = style;
        styleDirty_ = true;
    }

    void ShowText(const std::string& text) override {
        if (!swap_) return;
        {
            std::lock_guard<std::mutex> lk(mu_);
            text_ = Utf8ToW(text);
        }
        if (!visible_){ visible_ = true; ShowWindow(hwnd_, SW_SHOWNA); startLoop(); }
    }

    void Hide() override {
        visible_ = false;
        if (thr_.joinable()) thr_.join();
        ShowWindow(hwnd_, SW_HIDE);
    }

    ~OverlayWindow() override {
        visible_ = false;
        if (thr_.joinable()) thr_.join();
        if (dcomp_) dcomp_->Commit();
        if (hwnd_) DestroyWindow(hwnd_);
        if (com_) CoUninitialize();
    }

private:
    bool initD3D(){
        UINT flags = D3D11_CREATE_DEVICE_BGRA_SUPPORT; D3D_FEATURE_LEVEL flOut{};
        HRESULT hr = D3D11CreateDevice(nullptr, D3D_DRIVER_TYPE_HARDWARE, nullptr, flags, nullptr, 0, D3D11_SDK_VERSION, &d3d_, &flOut, &ctx_);
        if (FAILED(hr)) return false;
        hr = d3d_.As(&dxgi_); if (FAILED(hr)) return false;
        return SUCCEEDED(CreateDXGIFactory2(0, IID_PPV_ARGS(&factory_)));
    }

    bool initComposition(){
        HRESULT hr = DCompositionCreateDevice(dxgi_.Get(), IID_PPV_ARGS(&dcomp_)); if (FAILED(hr)) return false;
        hr = dcomp_->CreateTargetForHwnd(hwnd_, TRUE, &target_); if (FAILED(hr)) return false;
        hr = dcomp_->CreateVisual(&visual_); if (FAILED(hr)) return false;
        DXGI_SWAP_CHAIN_DESC1 desc{}; desc.Width = kOverlayWidth; desc.Height = kOverlayHeight; desc.Format = DXGI_FORMAT_B8G8R8A8_UNORM; desc.SampleDesc = {1,0};
        desc.BufferUsage = DXGI_USAGE_RENDER_TARGET_OUTPUT; desc.BufferCount = 2; desc.Scaling = DXGI_SCALING_STRETCH;
        desc.SwapEffect = DXGI_SWAP_EFFECT_FLIP_DISCARD; desc.AlphaMode = DXGI_ALPHA_MODE_PREMULTIPLIED;
        if (FAILED(factory_->CreateSwapChainForComposition(d3d_.Get(), &desc, nullptr, &swap_))) return false;
        ComPtr<ID3D11Texture2D> back; if (FAILED(swap_->GetBuffer(0, IID_PPV_ARGS(&back)))) return false;
        if (!initD2D(back.Get())) return false;
        visual_->SetContent(swap_.Get()); target_->SetRoot(visual_.Get()); return SUCCEEDED(dcomp_->Commit());
    }

    bool initD2D(ID3D11Texture2D* back){
        D2D1_FACTORY_OPTIONS o{};
        if (FAILED(D2D1CreateFactory(D2D1_FACTORY_TYPE_SINGLE_THREADED, __uuidof(ID2D1Factory1), &o, &d2dFactory_))) return false;
        if (FAILED(DWriteCreateFactory(DWRITE_FACTORY_TYPE_SHARED, __uuidof(IDWriteFactory), &dw_))) return false;
        ComPtr<IDXGISurface> surf; if (FAILED(back->QueryInterface(IID_PPV_ARGS(&surf)))) return false;
        D2D1_BITMAP_PROPERTIES1 bp = D2D1::BitmapProperties1(D2D1_BITMAP_OPTIONS_TARGET|D2D1_BITMAP_OPTIONS_CANNOT_DRAW,
            D2D1::PixelFormat(DXGI_FORMAT_B8G8R8A8_UNORM, D2D1_ALPHA_MODE_PREMULTIPLIED), 96.f, 96.f);
        if (FAILED(d2dFactory_->CreateDevice(dxgi_.Get(), &d2dDev_))) return false;
        if (FAILED(d2dDev_->CreateDeviceContext(D2D1_DEVICE_CONTEXT_OPTIONS_NONE, &d2dCtx_))) return false;
        if (FAILED(d2dCtx_->CreateBitmapFromDxgiSurface(surf.Get(), &bp, &d2dTarget_))) return false;
        d2dCtx_->SetTarget(d2dTarget_.Get());
        return true;
    }

    // Render thread only.
    void rebuildStyle(const OverlayStyle& style){
        banner_.Reset(); text_brush_.Reset(); fmt_.Reset();
        Rgb rgb = ParseColor(style.color).value_or(Rgb{255, 255, 255});
        d2dCtx_->CreateSolidColorBrush(D2D1::ColorF(0.f, 0.f, 0.f, style.backgroundAlpha / 255.f), &banner_);
        d2dCtx_->CreateSolidColorBrush(D2D1::ColorF(rgb.r / 255.f, rgb.g / 255.f, rgb.b / 255.f, 1.f), &text_brush_);
        std::wstring family = Utf8ToW(style.font.family);
        // DirectWrite sizes are DIPs; points to DIPs is 96/72.
        HRESULT hr = dw_->CreateTextFormat(family.c_str(), nullptr, DWRITE_FONT_WEIGHT_NORMAL, DWRITE_FONT_STYLE_NORMAL,
            DWRITE_FONT_STRETCH_NORMAL, style.font.pointSize * 96.f / 72.f, L"", &fmt_);
        if (FAILED(hr)){
            if (logger_) logger_->error("CreateTextFormat('{}', {}) failed: 0x{:08X}", style.font.family, style.font.pointSize, static_cast<unsigned>(hr));
            return;
        }
        fmt_->SetParagraphAlignment(DWRITE_PARAGRAPH_ALIGNMENT_CENTER);
        fmt_->SetTextAlignment(DWRITE_TEXT_ALIGNMENT_CENTER);
        fmt_->SetWordWrapping(DWRITE_WORD_WRAPPING_WRAP);
    }

    void startLoop(){
        if (thr_.joinable()) return;
        thr_ = std::thread([this]{ while(visible_){ draw(); swap_->Present(1,0); dcomp_->Commit(); Sleep(16); } });
    }

    void draw(){
        if (!d2dCtx_) return;
        std::wstring text; OverlayStyle style; bool dirty;
        {
            std::lock_guard<std::mutex> lk(mu_);
            text = text_; style = style_; dirty = styleDirty_; styleDirty_ = false;
        }
        if (dirty) rebuildStyle(style);
        d2dCtx_->BeginDraw(); d2dCtx_->Clear(D2D1::ColorF(0, 0));
        D2D1_SIZE_F sz = d2dCtx_->GetSize();
        if (banner_) d2dCtx_->FillRectangle(D2D1::RectF(0, 0, sz.width, sz.height), banner_.Get());
        if (fmt_ && text_brush_ && !text.empty()){
            D2D1_RECT_F rc = D2D1::RectF(12.f, 6.f, sz.width - 12.f, sz.height - 6.f);
            d2dCtx_->DrawTextW(text.c_str(), static_cast<UINT32>(text.size()), fmt_.Get(), rc, text_brush_.Get());
        }
        d2dCtx_->EndDraw();
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
    HWND hwnd_{}; bool com_{false}; std::atomic<bool> visible_{false};
    std::mutex mu_; std::wstring text_; OverlayStyle style_{}; bool styleDirty_{false};
    ComPtr<ID3D11Device> d3d_; ComPtr<ID3D11DeviceContext> ctx_; ComPtr<IDXGIDevice> dxgi_; ComPtr<IDXGIFactory2> factory_;
    ComPtr<IDXGISwapChain1> swap_;
    ComPtr<IDCompositionDevice> dcomp_; ComPtr<IDCompositionTarget> target_; ComPtr<IDCompositionVisual> visual_;
    std::thread thr_;
    ComPtr<ID2D1Factory1> d2dFactory_; ComPtr<ID2D1Device> d2dDev_; ComPtr<ID2D1DeviceContext> d2dCtx_; ComPtr<ID2D1Bitmap1> d2dTarget_;
    ComPtr<ID2D1SolidColorBrush> banner_; ComPtr<ID2D1SolidColorBrush> text_brush_;
    ComPtr<IDWriteFactory> dw_; ComPtr<IDWriteTextFormat> fmt_;
};

std::unique_ptr<ISubtitleOverlay> CreateOverlayWindow(std::shared_ptr<spdlog::logger> logger){
    return std::make_unique<OverlayWindow>(std::move(logger));
}

} // namespace Subtitler
