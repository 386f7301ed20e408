//! # Harness Driver Interface
//!
//! This header defines the main entry point for the fwtest CLI.
//!
//! ## Entry Point
//!
//! `fwtest_main()` dispatches to the appropriate command handler based on argv[1].

#pragma once

// Main harness driver entry point
// Dispatches to appropriate command handlers
int fwtest_main(int argc, char* argv[]);
