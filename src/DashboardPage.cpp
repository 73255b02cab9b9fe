#include "DashboardPage.h"

// ---- UI (inline HTML served from flash) ----
const char DASHBOARD_TEMPLATE[] = R"HTML(<!doctype html>
<html lang="en"><head><meta charset="utf-8">
<meta name="viewport" content="width=device-width,initial-scale=1">
<title>{{TITLE}}</title>
<style>
  :root{--bg:#ffffff;--panel:#f4f6f8;--ink:#1b1f24;--muted:#5f6b76;--grid:#d7dde3}
  [data-theme=dark]{--bg:#0f1317;--panel:#151a20;--ink:#e6edf3;--muted:#9aa7b2;--grid:#26303a}
  *{box-sizing:border-box}
  html,body{margin:0;background:var(--bg);color:var(--ink);font:14px/1.5 Roboto,system-ui,Arial}
  .top{display:flex;gap:8px;align-items:center;padding:8px 12px;border-bottom:1px solid var(--grid)}
  .pill{font-size:12px;color:var(--muted);border:1px solid var(--grid);border-radius:999px;padding:4px 10px}
  .title{font-weight:600;flex:1}
  .grid{display:grid;gap:12px;padding:12px;grid-template-columns:repeat(auto-fill,minmax(120px,1fr))}
  .pin{background:var(--panel);border:1px solid var(--grid);border-radius:12px;padding:10px;
       display:flex;flex-direction:column;align-items:center;gap:6px}
  .dot{width:41px;height:41px;border-radius:50%;border:3px solid rgba(0,0,0,.18);
       box-shadow:0 1px 2px rgba(0,0,0,.15) inset;transition:background-color .25s ease}
  .dot.hi{border-color:#d94134}
  .dot.na{background:#bdbdbd;border-style:dashed}
  .lbl{font-weight:700}
  .val{font-size:12px;color:var(--muted);min-height:18px}
  button{border:1px solid var(--grid);background:var(--panel);color:var(--ink);border-radius:8px;padding:4px 10px;cursor:pointer}
</style>
</head><body>
<div class="top">
  <div class="title">{{TITLE}}</div>
  <div class="pill">IP: <b>{{IP}}</b></div>
  <div class="pill">FW: <b>{{FIRMWARE}}</b></div>
  <div class="pill">Pins: <b>{{PIN_COUNT}}</b></div>
  <div class="pill">Gen: <b id="gen">{{GENERATION}}</b> @ <b id="ts">{{TIMESTAMP}}</b> ms</div>
  <div class="pill">Live: <b id="live">INIT</b></div>
  <button id="theme">Theme</button>
</div>
<div class="grid" id="pins">
{{PIN_CARDS}}
</div>
<script>
const VREF = {{VREF}}, BUCKETS = {{BUCKETS}}, ANALOG_HIGH = {{ANALOG_HIGH}};
const $ = id => document.getElementById(id);

/* Theme is a browser preference only */
(function(){
  const saved = localStorage.getItem('gpiolive-theme');
  if (saved) document.documentElement.dataset.theme = saved;
  $('theme').onclick = () => {
    const next = document.documentElement.dataset.theme === 'dark' ? 'light' : 'dark';
    document.documentElement.dataset.theme = next;
    localStorage.setItem('gpiolive-theme', next);
  };
})();

/* Same palette as the firmware renders */
function gradient(v){
  let b = Math.floor(Math.max(0, v) / VREF * BUCKETS);
  if (b >= BUCKETS) b = BUCKETS - 1;
  const t = BUCKETS > 1 ? b / (BUCKETS - 1) : 0;
  return `hsl(${Math.round(120*(1-t))},90%,${Math.round(35+30*t)}%)`;
}
function paint(label, p){
  const card = $('pin-' + label);
  if (!card || card.dataset.na) return;
  const dot = card.querySelector('.dot'), val = card.querySelector('.val');
  let color = '#bdbdbd', cls = 'err', text = 'ERR';
  if (p.state === 'LOW')   { color = '#2e9e5f'; cls = 'lo'; text = card.dataset.cap === 'touch' ? String(p.value) : 'LOW'; }
  if (p.state === 'HIGH')  { color = '#d94134'; cls = 'hi'; text = 'HIGH'; }
  if (p.state === 'TOUCH') { color = '#3b82f6'; cls = 'touch'; text = p.value; }
  if (p.state === 'ANALOG'){ color = gradient(p.value); cls = p.value >= ANALOG_HIGH ? 'hi' : 'lo'; text = p.value.toFixed(2) + ' V'; }
  dot.className = 'dot ' + cls;
  dot.style.background = color;
  val.textContent = text;
}
function apply(o){
  if (!o || !o.pins) return;
  $('gen').textContent = o.generation;
  $('ts').textContent = o.timestamp;
  for (const k of Object.keys(o.pins)) paint(k, o.pins[k]);
}

/* Live updates via SSE, polling /status as fallback */
function poll(){
  $('live').textContent = 'POLL';
  setInterval(async () => {
    try { apply(await (await fetch('/status', {cache:'no-store'})).json()); } catch(_){}
  }, 500);
}
if ('EventSource' in window) {
  const es = new EventSource('/events');
  es.onopen = () => { $('live').textContent = 'SSE'; };
  es.onmessage = e => { try { apply(JSON.parse(e.data)); } catch(_){} };
  es.onerror = () => { $('live').textContent = 'RETRY'; };
} else {
  poll();
}
</script>
</body></html>
)HTML";
