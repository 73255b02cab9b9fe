#ifndef DASHBOARD_PAGE_H
#define DASHBOARD_PAGE_H

// Dashboard document with {{KEY}} placeholders filled by ResponseRenderer:
// TITLE, FIRMWARE, IP, GENERATION, TIMESTAMP, PIN_COUNT, VREF, BUCKETS,
// ANALOG_HIGH, PIN_CARDS. The theme toggle lives entirely in the browser.
extern const char DASHBOARD_TEMPLATE[];

#endif
