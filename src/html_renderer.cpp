#include "html_renderer.hpp"

namespace keypub {

namespace {

const char* const kPageStyle = R"(
      body { font-family: sans-serif; max-width: 640px; margin: 2rem auto; padding: 0 1rem;
             background-color: #121212; color: #e0e0e0; })";

}

std::string HtmlRenderer::escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

const std::string& HtmlRenderer::form_page() {
    static const std::string page = std::string(R"(<!doctype html>
<html lang="en">
  <head>
    <meta charset="utf-8">
    <title>极名-公钥发布系统 Publish Your Signing Public Key</title>
    <style>)") + kPageStyle + R"(
      label { display: block; margin-top: 1rem; }
      textarea, input[type=text] { width: 100%; box-sizing: border-box; background-color: #1e1e1e;
                                   color: #e0e0e0; border: 1px solid #333; border-radius: 4px; padding: 0.4rem; }
      button { margin-top: 1.5rem; padding: 0.5rem 1.2rem; background-color: #2979ff;
               color: #fff; border: none; border-radius: 4px; cursor: pointer; }
      button:hover { background-color: #1565c0; }
      .hint { font-size: 0.9rem; color: #aaa; }
    </style>
  </head>
  <body>
    <h1>极名-公钥发布系统 Publish Your Signing Public Key</h1>
    <p class="hint">
      建議使用 ED25519 (EdDSA) 的 public key，一行 Base64 表示。
    </p>
    <form method="post" action="/publish">
      <label>
        Public key (required):
        <input type="text" name="public_key" required>
      </label>
      <label>
        Note / comment (optional):
        <textarea name="note" rows="3" maxlength="100" placeholder="例如：這是我用於簽名訊息的公鑰。"></textarea>
      </label>
      <button type="submit">Publish</button>
    </form>
  </body>
</html>
)";
    return page;
}

std::string HtmlRenderer::record_page(const KeyRecord& record, const std::string& share_url) {
    const std::string id = escape(record.id);

    std::string note_html;
    if (record.note) {
        note_html = "<p><strong>Note:</strong> " + escape(*record.note) + "</p>";
    } else {
        note_html = "<p><em>No note provided.</em></p>";
    }

    std::string page;
    page.reserve(2048 + record.public_key.size());
    page += R"(<!doctype html>
<html lang="en">
  <head>
    <meta charset="utf-8">
    <title>Published Key )" + id + R"(</title>
    <style>)" + kPageStyle + R"(
      code { padding: 0.2rem 0.4rem; background: #1e1e1e; border-radius: 4px; word-break: break-all; }
      a { color: #90caf9; }
      #share-link { flex: 1; padding: 0.4rem; background-color: #1e1e1e; color: #e0e0e0;
                    border: 1px solid #333; border-radius: 4px; }
      .copy { padding: 0.4rem 0.8rem; background-color: #2979ff; color: #fff; border: none;
              border-radius: 4px; cursor: pointer; }
      .hint { font-size: 0.85rem; color: #aaa; }
    </style>
  </head>
  <body>
    <h1>极名-公钥发布系统 Published Signing Public Key</h1>
    <p><strong>ID:</strong> )" + id + R"(</p>
    <p><strong>Public key:</strong><br><code>)" + escape(record.public_key) + R"(</code></p>
    )" + note_html + R"(
    <p><strong>Shareable link:</strong></p>
    <div style="display:flex; gap:0.5rem; align-items:center;">
      <input id="share-link" type="text" value=")" + escape(share_url) + R"HTML(" readonly>
      <button type="button" class="copy" onclick="copyLink()">Copy</button>
    </div>
    <p class="hint">Click “Copy” or select the text to share this link.</p>
    <hr>
    <p>You can share this link with others so they can obtain your public key.</p>
    <script>
      function copyLink() {
        const input = document.getElementById('share-link');
        if (!input) return;
        input.select();
        navigator.clipboard && navigator.clipboard.writeText(input.value).catch(() => {});
      }
    </script>
  </body>
</html>
)HTML";
    return page;
}

}
